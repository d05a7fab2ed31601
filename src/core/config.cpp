#include "lobbylink/core/config.hpp"
#include "lobbylink/core/utils.hpp"

namespace lobbylink::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = utils::StringUtils::trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::StringUtils::trim(line.substr(0, eq_pos));
        std::string value = utils::StringUtils::trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# lobbylink configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["signaling.url"] = "ws://127.0.0.1:8445/signaling";
    values_["signaling.reconnect_base_ms"] = "1000";
    values_["signaling.reconnect_cap_ms"] = "10000";
    values_["signaling.max_reconnect_attempts"] = "5";
    values_["session.negotiation_wait_ms"] = "3000";
    values_["session.failure_retry_ms"] = "2000";
    values_["session.disconnect_grace_ms"] = "8000";
    values_["session.connect_timeout_ms"] = "30000";
    values_["session.reconnect_settle_ms"] = "500";
    values_["session.join_offer_delay_ms"] = "500";
    values_["session.ice_servers"] = "stun:stun.l.google.com:19302";
    values_["transport.high_water_mark"] = "16777216";
    values_["transport.backpressure_retry_ms"] = "10";
    values_["transport.max_message_size"] = "4259840";
    values_["transfer.chunk_size"] = "4194304";
    values_["transfer.batch_size"] = "5";
    values_["transfer.max_concurrent"] = "10";
    values_["transfer.completion_timeout_ms"] = "5000";
    values_["transfer.history_limit"] = "100";
    values_["log.level"] = "info";
    values_["log.file"] = "lobbylink.log";
}

}
