#pragma once

#include "lobbylink/rtc/peer_connection.hpp"
#include "lobbylink/signaling/signaling_messages.hpp"
#include "lobbylink/transport/data_channel_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace lobbylink::session {

enum class SessionState {
    CONNECTING,
    CONNECTED,
    RENEGOTIATING,
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* to_string(SessionState state);

// Negotiation state for one remote peer. Owned by PeerSessionManager and only
// touched on its io_context.
struct PeerSession {
    PeerSession(boost::asio::io_context& io_context, std::string peer, std::uint64_t generation);

    std::string peer_id;
    std::string player_name;
    std::uint64_t generation;
    SessionState state = SessionState::CONNECTING;

    std::shared_ptr<rtc::PeerConnection> connection;
    std::shared_ptr<transport::DataChannelTransport> transport;

    // Candidates received before the remote description, in arrival order
    std::deque<rtc::IceCandidate> pending_candidates;
    bool remote_description_set = false;
    bool negotiating = false;
    // Our offer was sent and its answer has not been applied yet
    bool offer_outstanding = false;
    bool renegotiation_pending = false;
    bool remote_mic_enabled = false;

    // Offer that arrived mid-negotiation, applied when it ends or the wait times out
    std::optional<signaling::OfferMessage> deferred_offer;

    boost::asio::steady_timer connect_deadline;
    boost::asio::steady_timer reconnect_timer;
    boost::asio::steady_timer negotiation_wait_timer;

    void cancel_timers();
};

} // namespace lobbylink::session
