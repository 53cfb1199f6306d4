#include "sync_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace motium::sync {

namespace {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void read_ms(const YAML::Node& section, const char* key, std::chrono::milliseconds& out) {
    if (!section[key]) return;
    int64_t value = section[key].as<int64_t>();
    if (value <= 0) {
        throw ConfigError(std::string(key) + " must be positive");
    }
    out = std::chrono::milliseconds(value);
}

void read_minutes(const YAML::Node& section, const char* key, std::chrono::milliseconds& out) {
    if (!section[key]) return;
    int64_t value = section[key].as<int64_t>();
    if (value <= 0) {
        throw ConfigError(std::string(key) + " must be positive");
    }
    out = std::chrono::minutes(value);
}

template <typename T>
void read_value(const YAML::Node& section, const char* key, T& out) {
    if (section[key]) {
        out = section[key].as<T>();
    }
}

void apply_sync(const YAML::Node& node, SyncDaemonConfig& config) {
    read_ms(node, "interval_ms", config.sync.sync_interval);
    read_ms(node, "quick_interval_ms", config.sync.quick_sync_interval);
    read_ms(node, "min_time_since_last_sync_ms", config.sync.min_time_since_last_sync);
    read_ms(node, "remote_call_timeout_ms", config.sync.remote_call_timeout);
    read_value(node, "honor_retry_backoff", config.sync.honor_retry_backoff);

    if (node["entities"]) {
        for (const auto& entry : node["entities"]) {
            std::string name = entry.first.as<std::string>();
            std::string direction = entry.second.as<std::string>();
            auto entity_type = entity_type_from_string(name);
            if (!entity_type) {
                throw ConfigError("unknown entity type: " + name);
            }
            if (direction == "bidirectional") {
                config.sync.directions[*entity_type] = SyncDirection::BIDIRECTIONAL;
            } else if (direction == "export_only") {
                config.sync.directions[*entity_type] = SyncDirection::EXPORT_ONLY;
            } else {
                throw ConfigError("unknown sync direction for " + name + ": " + direction);
            }
        }
    }
}

void apply_retry(const YAML::Node& node, SyncDaemonConfig& config) {
    read_value(node, "max_retry_count", config.retry.max_retry_count);
    read_value(node, "base_backoff_ms", config.retry.base_backoff_ms);
    read_value(node, "max_backoff_ms", config.retry.max_backoff_ms);
    if (config.retry.max_retry_count < 0) {
        throw ConfigError("max_retry_count must not be negative");
    }
    if (config.retry.base_backoff_ms <= 0 ||
        config.retry.max_backoff_ms < config.retry.base_backoff_ms) {
        throw ConfigError("backoff must satisfy 0 < base_backoff_ms <= max_backoff_ms");
    }
}

void apply_token_refresh(const YAML::Node& node, SyncDaemonConfig& config) {
    read_ms(node, "min_refresh_interval_ms", config.token_refresh.min_refresh_interval);
    read_ms(node, "proactive_refresh_margin_ms", config.token_refresh.proactive_refresh_margin);
    read_ms(node, "refresh_timeout_ms", config.token_refresh.refresh_timeout);
    read_value(node, "reschedule_after_refresh", config.token_refresh.reschedule_after_refresh);
}

void apply_background(const YAML::Node& node, SyncDaemonConfig& config) {
    read_minutes(node, "repeat_interval_minutes", config.background.repeat_interval);
    read_minutes(node, "min_periodic_interval_minutes",
                 config.host_scheduler.min_periodic_interval);
    read_ms(node, "initial_backoff_ms", config.host_scheduler.initial_backoff);
    read_ms(node, "max_backoff_ms", config.host_scheduler.max_backoff);
    read_value(node, "requires_network", config.background.requires_network);
    read_value(node, "expiring_threshold_minutes", config.expiring_threshold_minutes);

    if (config.expiring_threshold_minutes <= 0) {
        throw ConfigError("expiring_threshold_minutes must be positive");
    }
    if (config.background.repeat_interval < config.host_scheduler.min_periodic_interval) {
        throw ConfigError("repeat_interval_minutes is below the host scheduler minimum");
    }
}

void apply_connectivity(const YAML::Node& node, SyncDaemonConfig& config) {
    read_value(node, "probe_host", config.connectivity.probe_host);
    read_value(node, "probe_port", config.connectivity.probe_port);
    read_ms(node, "poll_interval_ms", config.connectivity.poll_interval);
    read_ms(node, "probe_timeout_ms", config.connectivity.probe_timeout);
    read_value(node, "initially_available", config.connectivity.initially_available);
    if (config.connectivity.probe_port <= 0 || config.connectivity.probe_port > 65535) {
        throw ConfigError("probe_port out of range");
    }
}

}  // namespace

bool parse_sync_daemon_config(const std::string& yaml_text,
                              SyncDaemonConfig& config,
                              std::string* error) {
    SyncDaemonConfig parsed = config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return true;
        }
        if (!root.IsMap()) {
            throw ConfigError("top level must be a mapping");
        }

        if (root["sync"]) apply_sync(root["sync"], parsed);
        if (root["retry"]) apply_retry(root["retry"], parsed);
        if (root["token_refresh"]) apply_token_refresh(root["token_refresh"], parsed);
        if (root["background"]) apply_background(root["background"], parsed);
        if (root["connectivity"]) apply_connectivity(root["connectivity"], parsed);
    } catch (const YAML::Exception& e) {
        if (error) *error = std::string("invalid YAML: ") + e.what();
        return false;
    } catch (const ConfigError& e) {
        if (error) *error = e.what();
        return false;
    }

    config = parsed;
    return true;
}

bool load_sync_daemon_config(const std::string& path,
                             SyncDaemonConfig& config,
                             std::string* error) {
    std::ifstream in(path);
    if (!in) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::string parse_error;
    if (!parse_sync_daemon_config(buffer.str(), config, &parse_error)) {
        if (error) *error = path + ": " + parse_error;
        return false;
    }
    LOG(INFO) << "Loaded sync configuration from " << path;
    return true;
}

}  // namespace motium::sync
