#include "lobbylink/rtc/rtc_types.hpp"

namespace lobbylink::rtc {

const char* to_string(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::NEW: return "new";
        case PeerConnectionState::CONNECTING: return "connecting";
        case PeerConnectionState::CONNECTED: return "connected";
        case PeerConnectionState::DISCONNECTED: return "disconnected";
        case PeerConnectionState::FAILED: return "failed";
        case PeerConnectionState::CLOSED: return "closed";
    }
    return "unknown";
}

}
