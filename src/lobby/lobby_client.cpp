#include "lobbylink/lobby/lobby_client.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"

namespace lobbylink::lobby {

LobbyOptions LobbyOptions::from_config(const core::Config& config) {
    LobbyOptions options;
    options.signaling = core::SignalingOptions::from_config(config);
    options.session = core::SessionOptions::from_config(config);
    options.transfer = core::TransferOptions::from_config(config);
    return options;
}

LobbyClient::LobbyClient(boost::asio::io_context& io_context,
                         std::unique_ptr<signaling::SignalingTransport> signaling_transport,
                         rtc::PeerConnectionFactory& connection_factory,
                         rtc::MediaSource* media,
                         storage::FileStore& file_store,
                         const session::LocalIdentity& identity,
                         const LobbyOptions& options)
    : identity_(identity)
    , options_(options)
    , observer_(&default_observer_)
    , signaling_(io_context, std::move(signaling_transport), options.signaling)
    , sessions_(io_context, signaling_, connection_factory, media, options.session)
    , engine_(io_context, identity.client_id, sessions_, file_store, catalog_, options.transfer)
{
    sessions_.set_observer(this);

    engine_.set_progress_handler([this](const transfer::TransferProgress& progress) {
        observer_->on_transfer_progress(progress);
    });

    // Newcomers learn our shares on every roster event
    signaling_.subscribe<signaling::PlayersList>([this](const signaling::PlayersList&) { announce_shares(); });
    signaling_.subscribe<signaling::PlayerJoined>([this](const signaling::PlayerJoined&) { announce_shares(); });

    signaling_.subscribe<signaling::ShareAdded>([this](const signaling::ShareAdded& message) {
        auto share = message.share;
        if (share.owner_id.empty()) {
            share.owner_id = message.from;
        }
        if (share.owner_id == identity_.client_id) {
            return;
        }
        catalog_.apply_remote_added(share);
        observer_->on_share_changed(share, false);
    });
    signaling_.subscribe<signaling::ShareUpdated>([this](const signaling::ShareUpdated& message) {
        auto share = message.share;
        if (share.owner_id.empty()) {
            share.owner_id = message.from;
        }
        if (share.owner_id == identity_.client_id) {
            return;
        }
        catalog_.apply_remote_updated(share);
        observer_->on_share_changed(share, false);
    });
    signaling_.subscribe<signaling::ShareRemoved>([this](const signaling::ShareRemoved& message) {
        auto share = catalog_.remote_share(message.from, message.share_id);
        catalog_.apply_remote_removed(message.from, message.share_id);
        if (share) {
            observer_->on_share_changed(*share, true);
        }
    });
}

LobbyClient::~LobbyClient() {
    sessions_.set_observer(nullptr);
}

void LobbyClient::set_observer(LobbyObserver* observer) {
    observer_ = observer ? observer : &default_observer_;
}

void LobbyClient::join(const std::string& url, ResultHandler handler) {
    LOG_INFO("Joining lobby '{}' as {} ({})", identity_.lobby_name, identity_.player_name, identity_.client_id);
    sessions_.initialize(identity_, url, std::move(handler));
}

void LobbyClient::leave() {
    for (const auto& progress : engine_.list_transfers()) {
        if (!transfer::is_terminal(progress.status)) {
            auto result = engine_.cancel(progress.request_id);
            if (!result) {
                LOG_DEBUG("Cancel of {} on leave: {}", progress.request_id, result.describe());
            }
        }
    }
    sessions_.shutdown();
}

core::Result LobbyClient::share_folder(const std::string& share_id, const std::string& name,
                                       const std::filesystem::path& folder,
                                       std::optional<std::int64_t> expire_time) {
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Not a directory: " + folder.string());
    }

    storage::SharedFolder share;
    share.id = share_id;
    share.name = name;
    share.folder_path = folder;
    share.owner_id = identity_.client_id;
    share.expire_time = expire_time;
    share.created_at = core::utils::TimeUtils::unix_millis();

    auto result = catalog_.add_local_share(share);
    if (!result) {
        return result;
    }

    auto sent = signaling_.send(signaling::ShareAdded{identity_.client_id, share.to_share_info()});
    if (!sent) {
        LOG_WARN("Share '{}' will be announced on the next roster update: {}", name, sent.describe());
    }
    return core::Result();
}

core::Result LobbyClient::update_share(const storage::SharedFolder& share) {
    auto result = catalog_.update_local_share(share);
    if (!result) {
        return result;
    }

    auto updated = catalog_.local_share(share.id);
    if (updated) {
        auto sent = signaling_.send(signaling::ShareUpdated{identity_.client_id, updated->to_share_info()});
        if (!sent) {
            LOG_WARN("Share update not sent: {}", sent.describe());
        }
    }
    return core::Result();
}

core::Result LobbyClient::unshare(const std::string& share_id) {
    auto result = catalog_.remove_local_share(share_id);
    if (!result) {
        return result;
    }

    auto sent = signaling_.send(signaling::ShareRemoved{identity_.client_id, share_id});
    if (!sent) {
        LOG_WARN("Share removal not sent: {}", sent.describe());
    }
    return core::Result();
}

std::string LobbyClient::download(const transfer::FileDescriptor& file, const std::filesystem::path& save_path) {
    return engine_.request_download(file, save_path);
}

core::Result LobbyClient::cancel_transfer(const std::string& request_id) {
    return engine_.cancel(request_id);
}

void LobbyClient::announce_shares() {
    for (const auto& share : catalog_.local_shares()) {
        auto sent = signaling_.send(signaling::ShareAdded{identity_.client_id, share.to_share_info()});
        if (!sent) {
            LOG_DEBUG("Share announcement skipped: {}", sent.describe());
            return;
        }
    }
}

void LobbyClient::on_registration(const core::Result& result) {
    if (result) {
        LOG_INFO("Joined lobby '{}'", identity_.lobby_name);
    } else {
        LOG_WARN("Lobby registration failed: {}", result.message);
    }
    observer_->on_registered(result);
}

void LobbyClient::on_signaling_error(const core::Result& error) {
    observer_->on_fatal_error(error);
}

void LobbyClient::on_version_error(const signaling::VersionTooOld& notice) {
    LOG_CRITICAL("This client is too old ({} < {}), download {}", notice.current_version,
                 notice.minimum_version, notice.download_url);
}

void LobbyClient::on_peer_joined(const signaling::PlayerInfo& player) {
    observer_->on_player_joined(player);
}

void LobbyClient::on_peer_left(const std::string& peer_id) {
    auto removed = catalog_.remove_owner(peer_id);
    if (removed > 0) {
        LOG_DEBUG("Dropped {} share(s) of {}", removed, peer_id);
    }
    observer_->on_player_left(peer_id);
}

void LobbyClient::on_peer_status(const std::string& peer_id, bool mic_enabled) {
    observer_->on_player_status(peer_id, mic_enabled);
}

void LobbyClient::on_remote_stream(const std::string& peer_id, std::shared_ptr<rtc::AudioTrack> track) {
    observer_->on_remote_audio(peer_id, std::move(track));
}

void LobbyClient::on_chat(const signaling::ChatMessage& message) {
    observer_->on_chat(message);
}

void LobbyClient::on_transport_created(const std::string& peer_id,
                                       std::shared_ptr<transport::DataChannelTransport> transport) {
    transport->set_control_handler([this, peer_id](transport::ControlMessage message) {
        engine_.handle_control(peer_id, message);
    });
    transport->set_frame_handler([this, peer_id](transport::TransferFrame frame) {
        engine_.handle_frame(peer_id, frame);
    });
}

void LobbyClient::on_session_removed(const std::string& peer_id) {
    engine_.handle_peer_closed(peer_id);
}

} // namespace lobbylink::lobby
