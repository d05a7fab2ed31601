#include "lobbylink/core/options.hpp"
#include "lobbylink/core/utils.hpp"

namespace lobbylink::core {

namespace {

Milliseconds get_ms(const Config& config, const std::string& key, Milliseconds fallback) {
    return Milliseconds(config.get_int(key, static_cast<int>(fallback.count())));
}

std::size_t get_size(const Config& config, const std::string& key, std::size_t fallback) {
    auto value = config.get_uint64(key, fallback);
    return value == 0 ? fallback : static_cast<std::size_t>(value);
}

}

SignalingOptions SignalingOptions::from_config(const Config& config) {
    SignalingOptions options;
    options.url = config.get_string("signaling.url", options.url);
    options.reconnect_base = get_ms(config, "signaling.reconnect_base_ms", options.reconnect_base);
    options.reconnect_cap = get_ms(config, "signaling.reconnect_cap_ms", options.reconnect_cap);
    options.max_reconnect_attempts = config.get_int("signaling.max_reconnect_attempts",
                                                    options.max_reconnect_attempts);
    return options;
}

TransportOptions TransportOptions::from_config(const Config& config) {
    TransportOptions options;
    options.high_water_mark = get_size(config, "transport.high_water_mark", options.high_water_mark);
    options.backpressure_retry = get_ms(config, "transport.backpressure_retry_ms",
                                        options.backpressure_retry);
    options.max_message_size = get_size(config, "transport.max_message_size", options.max_message_size);
    return options;
}

SessionOptions SessionOptions::from_config(const Config& config) {
    SessionOptions options;
    options.negotiation_wait = get_ms(config, "session.negotiation_wait_ms", options.negotiation_wait);
    options.failure_retry = get_ms(config, "session.failure_retry_ms", options.failure_retry);
    options.disconnect_grace = get_ms(config, "session.disconnect_grace_ms", options.disconnect_grace);
    options.connect_timeout = get_ms(config, "session.connect_timeout_ms", options.connect_timeout);
    options.reconnect_settle = get_ms(config, "session.reconnect_settle_ms", options.reconnect_settle);
    options.join_offer_delay = get_ms(config, "session.join_offer_delay_ms", options.join_offer_delay);

    if (auto servers = config.get("session.ice_servers")) {
        options.ice_servers.clear();
        for (const auto& server : utils::StringUtils::split(*servers, ',')) {
            auto trimmed = utils::StringUtils::trim(server);
            if (!trimmed.empty()) {
                options.ice_servers.push_back(trimmed);
            }
        }
    }

    options.transport = TransportOptions::from_config(config);
    return options;
}

TransferOptions TransferOptions::from_config(const Config& config) {
    TransferOptions options;
    options.chunk_size = get_size(config, "transfer.chunk_size", options.chunk_size);
    options.batch_size = get_size(config, "transfer.batch_size", options.batch_size);
    options.max_concurrent = get_size(config, "transfer.max_concurrent", options.max_concurrent);
    options.completion_timeout = get_ms(config, "transfer.completion_timeout_ms",
                                        options.completion_timeout);
    options.history_limit = get_size(config, "transfer.history_limit", options.history_limit);
    return options;
}

}
