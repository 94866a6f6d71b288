#include "client_config.H"

#include "common/errors.H"

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <limits>
#include <random>
#include <type_traits>

using json = nlohmann::json;

namespace tws::client {

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    bool ok;
    if constexpr (std::is_same_v<T, std::string>) {
        ok = it->is_string();
    } else if constexpr (std::is_floating_point_v<T>) {
        ok = it->is_number();
    } else {
        ok = it->is_number_integer();
        if constexpr (std::is_unsigned_v<T>) {
            if (ok && !it->is_number_unsigned()) {
                ok = it->template get<int64_t>() >= 0;
            }
            ok = ok && it->template get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        } else {
            ok = ok && it->template get<int64_t>() >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                 it->template get<int64_t>() <= static_cast<int64_t>(std::numeric_limits<T>::max());
        }
    }
    if (!ok) {
        throw config_error(fmt::format("config key '{}' has the wrong type ({})", key, it->type_name()));
    }
    out = it->template get<T>();
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    read_key(j, key, ms);
    if (ms < 0) {
        throw config_error(fmt::format("config key '{}' must not be negative", key));
    }
    out = std::chrono::milliseconds(ms);
}

int random_client_id() {
    std::random_device rd;
    std::uniform_int_distribution<int> dist(1, 65535);
    return dist(rd);
}

} // namespace

client_config parse_config(const json& j) {
    if (!j.is_object()) {
        throw config_error("config must be a json object");
    }

    client_config config;
    conn::connection_settings& c = config.connection;

    read_key(j, "host", c.host);
    read_key(j, "port", c.port);
    c.client_id = random_client_id();
    read_key(j, "client_id", c.client_id);
    read_millis(j, "connect_timeout_ms", c.connect_timeout);
    read_millis(j, "heartbeat_interval_ms", c.heartbeat_interval);
    read_millis(j, "heartbeat_timeout_ms", c.heartbeat_timeout);
    read_millis(j, "write_timeout_ms", c.write_timeout);
    read_key(j, "reconnect_max_attempts", c.reconnect_max_attempts);
    read_millis(j, "reconnect_initial_backoff_ms", c.reconnect_initial_backoff);
    read_millis(j, "reconnect_max_backoff_ms", c.reconnect_max_backoff);
    read_key(j, "protocol_error_threshold", c.protocol_error_threshold);
    read_key(j, "optional_capabilities", c.optional_capabilities);

    read_key(j, "reconnect_every", config.reconnect_every);
    read_key(j, "quotes_buffer_size", config.quotes_buffer_size);
    read_millis(j, "request_timeout_ms", config.request_timeout);
    read_key(j, "log_dir", config.log_dir);
    read_key(j, "log_level", config.log_level);

    if (config.quotes_buffer_size < 1) {
        throw config_error("quotes_buffer_size must be at least 1");
    }
    return config;
}

client_config load_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw config_error(fmt::format("cannot open config file {}", filename));
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw config_error(fmt::format("cannot parse config file {}: {}", filename, e.what()));
    }
    return parse_config(j);
}

} // namespace tws::client
