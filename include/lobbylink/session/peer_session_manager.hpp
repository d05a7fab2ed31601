#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/core/options.hpp"
#include "lobbylink/rtc/media.hpp"
#include "lobbylink/rtc/peer_connection.hpp"
#include "lobbylink/session/peer_session.hpp"
#include "lobbylink/signaling/signaling_channel.hpp"
#include "lobbylink/transfer/transfer_engine.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lobbylink::session {

struct LocalIdentity {
    std::string client_id;
    std::string player_name;
    std::string virtual_ip;
    std::string virtual_domain;
    bool use_domain = false;
    std::string lobby_name;
    std::string lobby_password;
    std::string client_version = "1.2.0";
};

// Collaborator callbacks. All run on the io_context.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_registration(const core::Result& /*result*/) {}
    virtual void on_signaling_error(const core::Result& /*error*/) {}
    virtual void on_version_error(const signaling::VersionTooOld& /*notice*/) {}
    virtual void on_peer_joined(const signaling::PlayerInfo& /*player*/) {}
    virtual void on_peer_left(const std::string& /*peer_id*/) {}
    virtual void on_peer_status(const std::string& /*peer_id*/, bool /*mic_enabled*/) {}
    virtual void on_remote_stream(const std::string& /*peer_id*/, std::shared_ptr<rtc::AudioTrack> /*track*/) {}
    virtual void on_chat(const signaling::ChatMessage& /*message*/) {}
    virtual void on_session_state(const std::string& /*peer_id*/, SessionState /*state*/) {}
    // A fresh transport exists for peer_id; wire handlers before its channels open.
    virtual void on_transport_created(const std::string& /*peer_id*/,
                                      std::shared_ptr<transport::DataChannelTransport> /*transport*/) {}
    virtual void on_session_removed(const std::string& /*peer_id*/) {}
};

// One negotiation state machine per remote peer, driven by signaling events
// and local media changes.
class PeerSessionManager : public transfer::TransportProvider {
public:
    using ResultHandler = std::function<void(const core::Result&)>;

    PeerSessionManager(boost::asio::io_context& io_context,
                       signaling::SignalingChannel& signaling,
                       rtc::PeerConnectionFactory& factory,
                       rtc::MediaSource* media,
                       const core::SessionOptions& options);
    ~PeerSessionManager() override;

    PeerSessionManager(const PeerSessionManager&) = delete;
    PeerSessionManager& operator=(const PeerSessionManager&) = delete;

    // Connects signaling and registers. The handler reports the connect and
    // send outcome; acceptance arrives through SessionObserver::on_registration.
    void initialize(const LocalIdentity& identity, const std::string& url, ResultHandler handler);
    void shutdown();

    void set_observer(SessionObserver* observer);

    core::Result set_mic_enabled(bool enabled);
    bool mic_enabled() const { return mic_enabled_; }
    core::Result send_chat(const std::string& content);

    std::shared_ptr<transport::DataChannelTransport> transport_for(const std::string& peer_id) override;

    bool has_session(const std::string& peer_id) const { return sessions_.count(peer_id) > 0; }
    std::optional<SessionState> session_state(const std::string& peer_id) const;
    std::vector<std::string> peer_ids() const;
    std::vector<signaling::PlayerInfo> players() const;
    std::size_t pending_candidate_count(const std::string& peer_id) const;
    bool is_negotiating(const std::string& peer_id) const;
    const LocalIdentity& identity() const { return local_; }

    // The lexicographically greater id sends the initial offer.
    static bool should_initiate(const std::string& local_id, const std::string& remote_id) {
        return local_id > remote_id;
    }

private:
    void subscribe();

    void handle_players_list(const signaling::PlayersList& message);
    void handle_player_joined(const signaling::PlayerJoined& message);
    void handle_player_left(const signaling::PlayerLeft& message);
    void handle_offer(const signaling::OfferMessage& message, bool after_wait);
    void handle_answer(const signaling::AnswerMessage& message);
    void handle_candidate(const signaling::IceCandidateMessage& message);
    void handle_status(const signaling::StatusUpdate& message);

    PeerSession* create_session(const std::string& peer_id, bool initiator);
    PeerSession* find_session(const std::string& peer_id, std::uint64_t generation);
    void remove_session(const std::string& peer_id);

    void send_offer(PeerSession& session, bool ice_restart);
    core::Result apply_offer(PeerSession& session, const signaling::OfferMessage& message);
    void end_negotiation(PeerSession& session);
    void flush_candidates(PeerSession& session);
    void defer_offer(PeerSession& session, const signaling::OfferMessage& message);

    void handle_connection_state(const std::string& peer_id, std::uint64_t generation,
                                 rtc::PeerConnectionState state);
    void handle_negotiation_failure(const std::string& peer_id, const core::Result& error);
    void schedule_reconnect(PeerSession& session, core::Milliseconds delay);
    void reconnect(const std::string& peer_id);
    void schedule_offer(const std::string& peer_id, core::Milliseconds delay, bool ice_restart);

    void set_state(PeerSession& session, SessionState state);

    boost::asio::io_context& io_context_;
    signaling::SignalingChannel& signaling_;
    rtc::PeerConnectionFactory& factory_;
    rtc::MediaSource* media_;
    core::SessionOptions options_;

    LocalIdentity local_;
    SessionObserver default_observer_;
    SessionObserver* observer_;

    std::unordered_map<std::string, std::unique_ptr<PeerSession>> sessions_;
    std::map<std::string, signaling::PlayerInfo> roster_;
    std::unordered_map<std::string, std::deque<rtc::IceCandidate>> orphan_candidates_;
    std::unordered_map<std::string, std::unique_ptr<boost::asio::steady_timer>> offer_timers_;
    std::uint64_t next_generation_;

    std::shared_ptr<rtc::AudioTrack> local_track_;
    bool mic_enabled_;
    bool shutting_down_;
};

} // namespace lobbylink::session
