#include "lobbylink/session/peer_session.hpp"

namespace lobbylink::session {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING: return "connecting";
        case SessionState::CONNECTED: return "connected";
        case SessionState::RENEGOTIATING: return "renegotiating";
        case SessionState::DISCONNECTED: return "disconnected";
        case SessionState::FAILED: return "failed";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

PeerSession::PeerSession(boost::asio::io_context& io_context, std::string peer, std::uint64_t gen)
    : peer_id(std::move(peer))
    , generation(gen)
    , connect_deadline(io_context)
    , reconnect_timer(io_context)
    , negotiation_wait_timer(io_context)
{
}

void PeerSession::cancel_timers() {
    connect_deadline.cancel();
    reconnect_timer.cancel();
    negotiation_wait_timer.cancel();
}

} // namespace lobbylink::session
