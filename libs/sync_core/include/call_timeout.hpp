#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "sync_errors.hpp"

namespace motium::sync {

/// Run fn with an upper bound on how long the caller waits for it.
///
/// fn runs on its own detached thread; if it has not finished after
/// `timeout` a TimeoutError is thrown and the result is abandoned. The
/// callable must therefore own everything it touches (capture by value or
/// shared_ptr). Exceptions thrown by fn are rethrown to the caller.
/// A non-positive timeout runs fn inline.
template <typename Fn>
auto call_with_timeout(Fn fn, std::chrono::milliseconds timeout,
                       const std::string& what) -> decltype(fn()) {
    using Result = decltype(fn());

    if (timeout.count() <= 0) {
        return fn();
    }

    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw TimeoutError(what + " timed out after " +
                           std::to_string(timeout.count()) + " ms");
    }
    return future.get();
}

}  // namespace motium::sync
