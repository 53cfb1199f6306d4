#include "connectivity_monitor.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

namespace motium::sync {

ConnectivityMonitor::ConnectivityMonitor(ConnectivityConfig config, Probe probe)
    : config_(std::move(config)),
      probe_(std::move(probe)),
      available_(config_.initially_available) {
    if (!probe_) {
        std::string host = config_.probe_host;
        int port = config_.probe_port;
        auto timeout = config_.probe_timeout;
        probe_ = [host, port, timeout]() { return tcp_probe(host, port, timeout); };
    }
}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop();
}

bool ConnectivityMonitor::start() {
    if (running_) return true;

    running_ = true;
    try {
        monitor_thread_ = std::thread(&ConnectivityMonitor::monitor_loop, this);
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Failed to start connectivity monitor: " << e.what();
        running_ = false;
        return false;
    }
    LOG(INFO) << "Connectivity monitor started, probing " << config_.probe_host
              << ":" << config_.probe_port << " every "
              << config_.poll_interval.count() << " ms";
    return true;
}

void ConnectivityMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    wait_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    LOG(INFO) << "Connectivity monitor stopped";
}

void ConnectivityMonitor::set_network_available(bool available) {
    bool previous = available_.exchange(available);
    if (previous == available) {
        return;
    }

    if (available) {
        LOG(INFO) << "Network connection restored";
    } else {
        LOG(WARNING) << "Network connection lost";
    }
    notify(available);
}

bool ConnectivityMonitor::probe_once() {
    bool reachable = probe_();
    set_network_available(reachable);
    return reachable;
}

uint64_t ConnectivityMonitor::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    uint64_t id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void ConnectivityMonitor::remove_listener(uint64_t id) {
    // Wait out a dispatch in progress so the listener is never called again
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void ConnectivityMonitor::notify(bool available) {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);

    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }

    for (const auto& listener : snapshot) {
        try {
            listener(available);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Connectivity listener threw: " << e.what();
        }
    }
}

void ConnectivityMonitor::monitor_loop() {
    while (running_) {
        probe_once();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, config_.poll_interval, [this] { return !running_; });
    }
}

bool ConnectivityMonitor::tcp_probe(const std::string& host, int port,
                                    std::chrono::milliseconds timeout) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addresses = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        VLOG(2) << "Probe resolve failed for " << host << ": " << gai_strerror(rc);
        return false;
    }

    bool reachable = false;
    for (struct addrinfo* ai = addresses; ai && !reachable; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

        rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            reachable = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            if (poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
                    so_error == 0) {
                    reachable = true;
                }
            }
        }
        close(fd);
    }

    freeaddrinfo(addresses);
    return reachable;
}

}  // namespace motium::sync
