#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace motium::sync {

struct ConnectivityConfig {
    std::string probe_host = "localhost";
    int probe_port = 443;
    std::chrono::milliseconds poll_interval{10000};
    std::chrono::milliseconds probe_timeout{2000};
    bool initially_available = false;
};

/// Network availability flag with edge-triggered notifications.
///
/// Platform bridges push state with set_network_available(); on plain
/// Linux start() polls a reachability probe instead. Listeners fire only
/// when the state actually changes, one notification at a time.
class ConnectivityMonitor {
public:
    using Listener = std::function<void(bool available)>;
    using Probe = std::function<bool()>;

    explicit ConnectivityMonitor(ConnectivityConfig config = ConnectivityConfig{},
                                 Probe probe = nullptr);
    ~ConnectivityMonitor();

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    /// Start the polling thread
    bool start();
    void stop();
    bool is_running() const { return running_; }

    bool is_network_available() const { return available_; }

    void set_network_available(bool available);

    /// Run the probe once and publish its result
    bool probe_once();

    uint64_t add_listener(Listener listener);

    /// After this returns the listener is not running and will not be called
    void remove_listener(uint64_t id);

    /// TCP connect to host:port within timeout
    static bool tcp_probe(const std::string& host, int port,
                          std::chrono::milliseconds timeout);

private:
    void monitor_loop();
    void notify(bool available);

    ConnectivityConfig config_;
    Probe probe_;
    std::atomic<bool> available_;

    std::mutex listeners_mutex_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_ = 1;
    std::recursive_mutex dispatch_mutex_;

    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace motium::sync
