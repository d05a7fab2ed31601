#pragma once

#include "lobbylink/core/config.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lobbylink::core {

using Milliseconds = std::chrono::milliseconds;

struct SignalingOptions {
    std::string url = "ws://127.0.0.1:8445/signaling";
    Milliseconds reconnect_base{1000};
    Milliseconds reconnect_cap{10000};
    int max_reconnect_attempts = 5;
    std::string client_version = "1.2.0";

    static SignalingOptions from_config(const Config& config);
};

struct TransportOptions {
    std::size_t high_water_mark = 16 * 1024 * 1024;
    Milliseconds backpressure_retry{10};
    std::size_t buffered_amount_low_threshold = 256 * 1024;
    int control_max_retransmits = 3;
    Milliseconds transfer_max_packet_lifetime{3000};
    // Advertised to peers; leaves room for a full chunk plus its frame header
    std::size_t max_message_size = 4 * 1024 * 1024 + 64 * 1024;

    static TransportOptions from_config(const Config& config);
};

struct SessionOptions {
    Milliseconds negotiation_wait{3000};
    Milliseconds failure_retry{2000};
    Milliseconds disconnect_grace{8000};
    Milliseconds connect_timeout{30000};
    Milliseconds reconnect_settle{500};
    Milliseconds join_offer_delay{500};
    std::vector<std::string> ice_servers{"stun:stun.l.google.com:19302"};
    TransportOptions transport;

    static SessionOptions from_config(const Config& config);
};

struct TransferOptions {
    std::size_t chunk_size = 4 * 1024 * 1024;
    std::size_t batch_size = 5;
    std::size_t max_concurrent = 10;
    Milliseconds completion_timeout{5000};
    Milliseconds speed_sample_interval{50};
    // Finished, failed and cancelled records kept for progress queries
    std::size_t history_limit = 100;

    static TransferOptions from_config(const Config& config);
};

}
