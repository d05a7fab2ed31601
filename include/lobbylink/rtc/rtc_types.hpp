#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lobbylink::rtc {

enum class PeerConnectionState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* to_string(PeerConnectionState state);

struct SessionDescription {
    std::string type;   // "offer" or "answer"
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    int sdp_mline_index = 0;
    std::string sdp_mid;
};

struct DataChannelInit {
    bool ordered = true;
    std::optional<int> max_retransmits;
    std::optional<std::chrono::milliseconds> max_packet_lifetime;
    std::size_t buffered_amount_low_threshold = 0;
};

struct RtcConfiguration {
    std::vector<std::string> ice_servers;
    // Largest data channel message accepted locally; unset keeps the stack's default
    std::optional<std::size_t> max_message_size;
};

}
