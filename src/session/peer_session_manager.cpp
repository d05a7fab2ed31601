#include "lobbylink/session/peer_session_manager.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"
#include <set>

namespace lobbylink::session {

using signaling::AnswerMessage;
using signaling::IceCandidateMessage;
using signaling::OfferMessage;

PeerSessionManager::PeerSessionManager(boost::asio::io_context& io_context,
                                       signaling::SignalingChannel& signaling,
                                       rtc::PeerConnectionFactory& factory,
                                       rtc::MediaSource* media,
                                       const core::SessionOptions& options)
    : io_context_(io_context)
    , signaling_(signaling)
    , factory_(factory)
    , media_(media)
    , options_(options)
    , observer_(&default_observer_)
    , next_generation_(1)
    , mic_enabled_(false)
    , shutting_down_(false)
{
    subscribe();
}

PeerSessionManager::~PeerSessionManager() {
    shutting_down_ = true;
    for (auto& [peer_id, timer] : offer_timers_) {
        timer->cancel();
    }
    for (auto& [peer_id, session] : sessions_) {
        session->cancel_timers();
        if (session->transport) {
            session->transport->close();
        }
        if (session->connection) {
            session->connection->close();
        }
    }
    if (local_track_) {
        local_track_->stop();
    }
}

void PeerSessionManager::set_observer(SessionObserver* observer) {
    observer_ = observer ? observer : &default_observer_;
}

void PeerSessionManager::subscribe() {
    signaling_.subscribe<signaling::RegisterSuccess>([this](const signaling::RegisterSuccess&) {
        observer_->on_registration(core::Result());
    });
    signaling_.subscribe<signaling::RegisterError>([this](const signaling::RegisterError& message) {
        observer_->on_registration(core::Result(core::ErrorCode::SIGNALING_REJECTED, message.message));
    });
    signaling_.subscribe<signaling::VersionTooOld>([this](const signaling::VersionTooOld& message) {
        observer_->on_version_error(message);
    });
    signaling_.subscribe<signaling::PlayersList>([this](const signaling::PlayersList& message) {
        handle_players_list(message);
    });
    signaling_.subscribe<signaling::PlayerJoined>([this](const signaling::PlayerJoined& message) {
        handle_player_joined(message);
    });
    signaling_.subscribe<signaling::PlayerLeft>([this](const signaling::PlayerLeft& message) {
        handle_player_left(message);
    });
    signaling_.subscribe<OfferMessage>([this](const OfferMessage& message) {
        handle_offer(message, false);
    });
    signaling_.subscribe<AnswerMessage>([this](const AnswerMessage& message) {
        handle_answer(message);
    });
    signaling_.subscribe<IceCandidateMessage>([this](const IceCandidateMessage& message) {
        handle_candidate(message);
    });
    signaling_.subscribe<signaling::StatusUpdate>([this](const signaling::StatusUpdate& message) {
        handle_status(message);
    });
    signaling_.subscribe<signaling::ChatMessage>([this](const signaling::ChatMessage& message) {
        observer_->on_chat(message);
    });

    signaling_.set_error_handler([this](const core::Result& error) {
        LOG_ERROR("Signaling error: {}", error.describe());
        observer_->on_signaling_error(error);
    });
}

void PeerSessionManager::initialize(const LocalIdentity& identity, const std::string& url, ResultHandler handler) {
    local_ = identity;
    shutting_down_ = false;

    signaling_.connect(url, [this, handler = std::move(handler)](const core::Result& result) {
        if (!result) {
            handler(result);
            return;
        }

        signaling::RegisterMessage registration;
        registration.client_id = local_.client_id;
        registration.player_name = local_.player_name;
        registration.virtual_ip = local_.virtual_ip;
        registration.virtual_domain = local_.virtual_domain;
        registration.use_domain = local_.use_domain;
        registration.lobby_name = local_.lobby_name;
        registration.lobby_password = local_.lobby_password;
        registration.client_version = local_.client_version;
        handler(signaling_.register_client(registration));
    });
}

void PeerSessionManager::shutdown() {
    if (shutting_down_) {
        return;
    }
    shutting_down_ = true;
    LOG_INFO("Shutting down {} peer session(s)", sessions_.size());

    for (auto& [peer_id, timer] : offer_timers_) {
        timer->cancel();
    }
    offer_timers_.clear();

    for (const auto& peer_id : peer_ids()) {
        remove_session(peer_id);
    }
    orphan_candidates_.clear();

    if (local_track_) {
        local_track_->stop();
        local_track_.reset();
    }
    mic_enabled_ = false;

    signaling_.disconnect();
}

core::Result PeerSessionManager::set_mic_enabled(bool enabled) {
    if (enabled == mic_enabled_) {
        return core::Result();
    }

    std::shared_ptr<rtc::AudioTrack> track;
    if (enabled) {
        if (!media_) {
            return core::Result(core::ErrorCode::INVALID_STATE, "No media source configured");
        }
        track = media_->capture_audio();
        if (!track) {
            return core::Result(core::ErrorCode::INVALID_STATE, "Audio capture unavailable");
        }
    }

    if (local_track_) {
        local_track_->stop();
    }
    local_track_ = track;
    mic_enabled_ = enabled;
    LOG_INFO("Microphone {}", enabled ? "enabled" : "disabled");

    // Reuse every session: swap the sender's track, then one more offer/answer round
    for (auto& [peer_id, session] : sessions_) {
        auto replaced = session->connection->replace_audio_track(track);
        if (!replaced) {
            LOG_WARN("Track replace for {} failed: {}", peer_id, replaced.describe());
        }

        if (session->state != SessionState::CONNECTED && session->state != SessionState::RENEGOTIATING) {
            continue;
        }
        if (session->negotiating) {
            session->renegotiation_pending = true;
            continue;
        }
        set_state(*session, SessionState::RENEGOTIATING);
        send_offer(*session, false);
    }

    auto status = signaling_.send(signaling::StatusUpdate{local_.client_id, enabled});
    if (!status) {
        LOG_WARN("Status update not sent: {}", status.describe());
    }
    return core::Result();
}

core::Result PeerSessionManager::send_chat(const std::string& content) {
    if (content.empty()) {
        return core::Result(core::ErrorCode::INVALID_MESSAGE, "Empty chat message");
    }

    signaling::ChatMessage message;
    message.from = local_.client_id;
    message.player_id = local_.client_id;
    message.player_name = local_.player_name;
    message.content = content;
    message.timestamp = core::utils::TimeUtils::unix_millis();
    return signaling_.send(message);
}

std::shared_ptr<transport::DataChannelTransport> PeerSessionManager::transport_for(const std::string& peer_id) {
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second->transport;
}

std::optional<SessionState> PeerSessionManager::session_state(const std::string& peer_id) const {
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->state;
}

std::vector<std::string> PeerSessionManager::peer_ids() const {
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [peer_id, session] : sessions_) {
        ids.push_back(peer_id);
    }
    return ids;
}

std::vector<signaling::PlayerInfo> PeerSessionManager::players() const {
    std::vector<signaling::PlayerInfo> players;
    for (const auto& [id, player] : roster_) {
        players.push_back(player);
    }
    return players;
}

std::size_t PeerSessionManager::pending_candidate_count(const std::string& peer_id) const {
    auto it = sessions_.find(peer_id);
    if (it != sessions_.end()) {
        return it->second->pending_candidates.size();
    }
    auto orphan = orphan_candidates_.find(peer_id);
    return orphan == orphan_candidates_.end() ? 0 : orphan->second.size();
}

bool PeerSessionManager::is_negotiating(const std::string& peer_id) const {
    auto it = sessions_.find(peer_id);
    return it != sessions_.end() && it->second->negotiating;
}

void PeerSessionManager::handle_players_list(const signaling::PlayersList& message) {
    LOG_INFO("Lobby snapshot: {} player(s)", message.players.size());

    // After a signaling reconnect the snapshot is authoritative
    std::set<std::string> present;
    for (const auto& player : message.players) {
        present.insert(player.player_id);
    }
    std::vector<signaling::PlayerLeft> departed;
    for (const auto& [peer_id, player] : roster_) {
        if (!present.contains(peer_id)) {
            departed.push_back(signaling::PlayerLeft{peer_id, player.virtual_domain});
        }
    }
    for (const auto& gone : departed) {
        LOG_INFO("{} is missing from the lobby snapshot", gone.player_id);
        handle_player_left(gone);
    }

    for (const auto& player : message.players) {
        if (player.player_id == local_.client_id) {
            continue;
        }
        const bool known = roster_.contains(player.player_id);
        roster_[player.player_id] = player;
        if (!known) {
            observer_->on_peer_joined(player);
        }

        if (has_session(player.player_id) || !should_initiate(local_.client_id, player.player_id)) {
            continue;
        }

        LOG_DEBUG("Initiating session with {}", player.player_id);
        if (auto* session = create_session(player.player_id, true)) {
            send_offer(*session, false);
        }
    }
}

void PeerSessionManager::handle_player_joined(const signaling::PlayerJoined& message) {
    const auto& player = message.player;
    if (player.player_id == local_.client_id) {
        return;
    }

    LOG_INFO("{} ({}) joined the lobby", player.player_name, player.player_id);
    roster_[player.player_id] = player;
    observer_->on_peer_joined(player);

    // A rejoining peer has a fresh connection; anything but a live session is stale
    if (auto state = session_state(player.player_id); state && *state != SessionState::CONNECTED) {
        remove_session(player.player_id);
    }

    if (!has_session(player.player_id) && should_initiate(local_.client_id, player.player_id)) {
        schedule_offer(player.player_id, options_.join_offer_delay, false);
    }
}

void PeerSessionManager::handle_player_left(const signaling::PlayerLeft& message) {
    LOG_INFO("{} left the lobby", message.player_id);

    if (auto it = offer_timers_.find(message.player_id); it != offer_timers_.end()) {
        it->second->cancel();
        offer_timers_.erase(it);
    }
    orphan_candidates_.erase(message.player_id);
    remove_session(message.player_id);
    roster_.erase(message.player_id);
    observer_->on_peer_left(message.player_id);
}

void PeerSessionManager::handle_offer(const OfferMessage& message, bool after_wait) {
    if (shutting_down_) {
        return;
    }

    const auto& peer_id = message.from;
    if (auto it = roster_.find(peer_id); it != roster_.end() && !message.player_name.empty()) {
        it->second.player_name = message.player_name;
    }

    // Their offer supersedes one we were about to send
    if (auto it = offer_timers_.find(peer_id); it != offer_timers_.end()) {
        it->second->cancel();
        offer_timers_.erase(it);
    }

    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
        LOG_INFO("Offer from {}, creating session", peer_id);
        auto* session = create_session(peer_id, false);
        if (!session) {
            return;
        }
        if (auto result = apply_offer(*session, message); !result) {
            handle_negotiation_failure(peer_id, result);
        }
        return;
    }

    auto& session = *it->second;
    if (session.negotiating && !after_wait) {
        defer_offer(session, message);
        return;
    }

    if (session.state == SessionState::CONNECTED || session.state == SessionState::RENEGOTIATING || after_wait) {
        LOG_INFO("Renegotiating session with {}", peer_id);
        set_state(session, SessionState::RENEGOTIATING);
        if (apply_offer(session, message)) {
            return;
        }
        LOG_WARN("Renegotiation with {} failed, rebuilding session", peer_id);
    } else {
        LOG_INFO("Offer from {} replaces {} session", peer_id, to_string(session.state));
    }

    remove_session(peer_id);
    auto* fresh = create_session(peer_id, false);
    if (!fresh) {
        return;
    }
    if (auto result = apply_offer(*fresh, message); !result) {
        handle_negotiation_failure(peer_id, result);
    }
}

void PeerSessionManager::defer_offer(PeerSession& session, const OfferMessage& message) {
    const bool waiting = session.deferred_offer.has_value();
    session.deferred_offer = message;
    if (waiting) {
        return;
    }

    LOG_DEBUG("Negotiation with {} in progress, holding offer", session.peer_id);
    session.negotiation_wait_timer.expires_after(options_.negotiation_wait);
    session.negotiation_wait_timer.async_wait(
        [this, peer_id = session.peer_id, generation = session.generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            auto* session = find_session(peer_id, generation);
            if (!session || !session->deferred_offer) {
                return;
            }

            LOG_WARN("Negotiation with {} did not finish within {}ms, proceeding with held offer",
                     peer_id, options_.negotiation_wait.count());
            auto offer = std::move(*session->deferred_offer);
            session->deferred_offer.reset();
            session->negotiating = false;
            session->offer_outstanding = false;
            handle_offer(offer, true);
        });
}

core::Result PeerSessionManager::apply_offer(PeerSession& session, const OfferMessage& message) {
    session.negotiating = true;
    session.offer_outstanding = false;

    auto result = session.connection->set_remote_description(message.offer);
    if (!result) {
        session.negotiating = false;
        return result;
    }
    session.remote_description_set = true;
    flush_candidates(session);

    session.connection->create_answer(
        [this, peer_id = session.peer_id, generation = session.generation](const core::Result& result,
                                                                           const rtc::SessionDescription& answer) {
            auto* session = find_session(peer_id, generation);
            if (!session) {
                return;
            }
            if (!result) {
                handle_negotiation_failure(peer_id, result);
                return;
            }

            auto sent = signaling_.send(AnswerMessage{local_.client_id, peer_id, answer});
            if (!sent) {
                LOG_WARN("Answer to {} not sent: {}", peer_id, sent.describe());
            }
            end_negotiation(*session);
        });
    return core::Result();
}

void PeerSessionManager::handle_answer(const AnswerMessage& message) {
    auto it = sessions_.find(message.from);
    if (it == sessions_.end()) {
        LOG_WARN("Answer from {} without a session", message.from);
        return;
    }

    auto& session = *it->second;
    if (!session.negotiating || !session.offer_outstanding) {
        LOG_WARN("Dropping answer from {}: no offer of ours is outstanding ({})", message.from,
                 to_string(session.state));
        return;
    }

    auto result = session.connection->set_remote_description(message.answer);
    if (!result) {
        handle_negotiation_failure(message.from, result);
        return;
    }

    session.offer_outstanding = false;
    session.remote_description_set = true;
    flush_candidates(session);
    end_negotiation(session);
}

void PeerSessionManager::handle_candidate(const IceCandidateMessage& message) {
    auto it = sessions_.find(message.from);
    if (it == sessions_.end()) {
        LOG_DEBUG("Holding candidate from {} until its session exists", message.from);
        orphan_candidates_[message.from].push_back(message.candidate);
        return;
    }

    auto& session = *it->second;
    if (!session.remote_description_set) {
        session.pending_candidates.push_back(message.candidate);
        return;
    }

    auto result = session.connection->add_remote_candidate(message.candidate);
    if (!result) {
        LOG_WARN("Candidate from {} rejected: {}", message.from, result.describe());
    }
}

void PeerSessionManager::handle_status(const signaling::StatusUpdate& message) {
    if (auto it = sessions_.find(message.client_id); it != sessions_.end()) {
        it->second->remote_mic_enabled = message.mic_enabled;
    }
    observer_->on_peer_status(message.client_id, message.mic_enabled);
}

PeerSession* PeerSessionManager::create_session(const std::string& peer_id, bool initiator) {
    auto connection = factory_.create(peer_id);
    if (!connection) {
        LOG_ERROR("Could not create a peer connection for {}", peer_id);
        return nullptr;
    }

    auto session = std::make_unique<PeerSession>(io_context_, peer_id, next_generation_++);
    session->connection = connection;
    session->transport = std::make_shared<transport::DataChannelTransport>(io_context_, peer_id, options_.transport);
    if (auto it = roster_.find(peer_id); it != roster_.end()) {
        session->player_name = it->second.player_name;
    }

    const auto generation = session->generation;

    connection->on_local_candidate([this, peer_id, generation](const rtc::IceCandidate& candidate) {
        if (!find_session(peer_id, generation)) {
            return;
        }
        auto sent = signaling_.send(IceCandidateMessage{local_.client_id, peer_id, candidate});
        if (!sent) {
            LOG_DEBUG("Candidate for {} not sent: {}", peer_id, sent.describe());
        }
    });
    connection->on_state_change([this, peer_id, generation](rtc::PeerConnectionState state) {
        handle_connection_state(peer_id, generation, state);
    });
    connection->on_data_channel([this, peer_id, generation](std::shared_ptr<rtc::DataChannel> channel) {
        auto* session = find_session(peer_id, generation);
        if (!session) {
            return;
        }
        if (channel->label() == transport::CONTROL_CHANNEL_LABEL) {
            session->transport->attach_control_channel(channel);
        } else if (channel->label() == transport::TRANSFER_CHANNEL_LABEL) {
            session->transport->attach_transfer_channel(channel);
        } else {
            LOG_DEBUG("Ignoring data channel '{}' from {}", channel->label(), peer_id);
        }
    });
    connection->on_remote_track([this, peer_id, generation](std::shared_ptr<rtc::AudioTrack> track) {
        if (find_session(peer_id, generation)) {
            LOG_INFO("Receiving audio from {}", peer_id);
            observer_->on_remote_stream(peer_id, track);
        }
    });

    // Sender exists from the start so mic toggles only swap tracks
    connection->add_audio_sender();
    if (mic_enabled_ && local_track_) {
        auto replaced = connection->replace_audio_track(local_track_);
        if (!replaced) {
            LOG_WARN("Could not attach microphone for {}: {}", peer_id, replaced.describe());
        }
    }

    if (auto orphans = orphan_candidates_.find(peer_id); orphans != orphan_candidates_.end()) {
        session->pending_candidates = std::move(orphans->second);
        orphan_candidates_.erase(orphans);
    }

    session->connect_deadline.expires_after(options_.connect_timeout);
    session->connect_deadline.async_wait([this, peer_id, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto* session = find_session(peer_id, generation);
        if (!session || session->state == SessionState::CONNECTED) {
            return;
        }
        LOG_WARN("No connection to {} within {}ms", peer_id, options_.connect_timeout.count());
        schedule_reconnect(*session, core::Milliseconds(0));
    });

    auto* raw = session.get();
    sessions_[peer_id] = std::move(session);
    LOG_INFO("Session with {} created ({})", peer_id, initiator ? "initiator" : "responder");

    observer_->on_transport_created(peer_id, raw->transport);

    if (initiator) {
        raw->transport->attach_control_channel(connection->create_data_channel(
            transport::CONTROL_CHANNEL_LABEL, transport::DataChannelTransport::control_channel_init(options_.transport)));
        raw->transport->attach_transfer_channel(connection->create_data_channel(
            transport::TRANSFER_CHANNEL_LABEL, transport::DataChannelTransport::transfer_channel_init(options_.transport)));
    }

    observer_->on_session_state(peer_id, raw->state);
    return raw;
}

PeerSession* PeerSessionManager::find_session(const std::string& peer_id, std::uint64_t generation) {
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end() || it->second->generation != generation) {
        return nullptr;
    }
    return it->second.get();
}

void PeerSessionManager::remove_session(const std::string& peer_id) {
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
        return;
    }

    auto session = std::move(it->second);
    sessions_.erase(it);

    session->cancel_timers();
    session->deferred_offer.reset();
    session->transport->close();
    session->connection->close();
    session->state = SessionState::CLOSED;

    LOG_INFO("Session with {} closed", peer_id);
    observer_->on_session_state(peer_id, SessionState::CLOSED);
    observer_->on_session_removed(peer_id);
}

void PeerSessionManager::send_offer(PeerSession& session, bool ice_restart) {
    session.negotiating = true;
    session.offer_outstanding = true;

    session.connection->create_offer(ice_restart,
        [this, peer_id = session.peer_id, generation = session.generation](const core::Result& result,
                                                                           const rtc::SessionDescription& offer) {
            if (!find_session(peer_id, generation)) {
                return;
            }
            if (!result) {
                handle_negotiation_failure(peer_id, result);
                return;
            }

            auto sent = signaling_.send(OfferMessage{local_.client_id, peer_id, offer, local_.player_name});
            if (!sent) {
                LOG_WARN("Offer to {} not sent: {}", peer_id, sent.describe());
            }
        });
}

void PeerSessionManager::end_negotiation(PeerSession& session) {
    session.negotiating = false;

    if (session.state == SessionState::RENEGOTIATING &&
        session.connection->state() == rtc::PeerConnectionState::CONNECTED) {
        set_state(session, SessionState::CONNECTED);
    }

    if (session.deferred_offer) {
        auto offer = std::move(*session.deferred_offer);
        session.deferred_offer.reset();
        session.negotiation_wait_timer.cancel();
        boost::asio::post(io_context_, [this, offer = std::move(offer)] { handle_offer(offer, false); });
        return;
    }

    if (session.renegotiation_pending) {
        session.renegotiation_pending = false;
        set_state(session, SessionState::RENEGOTIATING);
        send_offer(session, false);
    }
}

void PeerSessionManager::flush_candidates(PeerSession& session) {
    if (!session.pending_candidates.empty()) {
        LOG_DEBUG("Applying {} queued candidate(s) for {}", session.pending_candidates.size(), session.peer_id);
    }

    while (!session.pending_candidates.empty()) {
        auto candidate = std::move(session.pending_candidates.front());
        session.pending_candidates.pop_front();

        auto result = session.connection->add_remote_candidate(candidate);
        if (!result) {
            LOG_WARN("Queued candidate for {} rejected: {}", session.peer_id, result.describe());
        }
    }
}

void PeerSessionManager::handle_connection_state(const std::string& peer_id, std::uint64_t generation,
                                                 rtc::PeerConnectionState state) {
    auto* session = find_session(peer_id, generation);
    if (!session) {
        return;
    }

    LOG_DEBUG("Connection to {} is {}", peer_id, rtc::to_string(state));

    switch (state) {
        case rtc::PeerConnectionState::CONNECTED:
            session->connect_deadline.cancel();
            session->reconnect_timer.cancel();
            // A renegotiation in flight finishes in end_negotiation
            if (!(session->state == SessionState::RENEGOTIATING && session->negotiating)) {
                set_state(*session, SessionState::CONNECTED);
            }
            break;
        case rtc::PeerConnectionState::DISCONNECTED:
            set_state(*session, SessionState::DISCONNECTED);
            schedule_reconnect(*session, options_.disconnect_grace);
            break;
        case rtc::PeerConnectionState::FAILED:
            set_state(*session, SessionState::FAILED);
            schedule_reconnect(*session, options_.failure_retry);
            break;
        case rtc::PeerConnectionState::CLOSED:
            remove_session(peer_id);
            break;
        default:
            break;
    }
}

void PeerSessionManager::handle_negotiation_failure(const std::string& peer_id, const core::Result& error) {
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
        return;
    }

    LOG_ERROR("Negotiation with {} failed: {}", peer_id, error.describe());
    auto& session = *it->second;
    session.negotiating = false;
    session.offer_outstanding = false;
    set_state(session, SessionState::FAILED);
    schedule_reconnect(session, options_.failure_retry);
}

void PeerSessionManager::schedule_reconnect(PeerSession& session, core::Milliseconds delay) {
    if (shutting_down_) {
        return;
    }
    if (!should_initiate(local_.client_id, session.peer_id)) {
        LOG_INFO("Waiting for {} to re-initiate", session.peer_id);
        return;
    }

    LOG_INFO("Reconnecting to {} in {}ms unless it recovers", session.peer_id, delay.count());
    session.reconnect_timer.expires_after(delay);
    session.reconnect_timer.async_wait(
        [this, peer_id = session.peer_id, generation = session.generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            auto* session = find_session(peer_id, generation);
            if (!session || session->state == SessionState::CONNECTED) {
                return;
            }
            reconnect(peer_id);
        });
}

void PeerSessionManager::reconnect(const std::string& peer_id) {
    LOG_INFO("Rebuilding session with {}", peer_id);
    remove_session(peer_id);
    schedule_offer(peer_id, options_.reconnect_settle, true);
}

void PeerSessionManager::schedule_offer(const std::string& peer_id, core::Milliseconds delay, bool ice_restart) {
    auto& timer = offer_timers_[peer_id];
    if (!timer) {
        timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    }

    timer->expires_after(delay);
    timer->async_wait([this, peer_id, ice_restart](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || shutting_down_) {
            return;
        }
        offer_timers_.erase(peer_id);

        if (roster_.count(peer_id) == 0 || has_session(peer_id)) {
            return;
        }
        if (auto* session = create_session(peer_id, true)) {
            send_offer(*session, ice_restart);
        }
    });
}

void PeerSessionManager::set_state(PeerSession& session, SessionState state) {
    if (session.state == state) {
        return;
    }
    LOG_INFO("Session {}: {} -> {}", session.peer_id, to_string(session.state), to_string(state));
    session.state = state;
    observer_->on_session_state(session.peer_id, state);
}

} // namespace lobbylink::session
