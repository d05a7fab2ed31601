#pragma once

#include "lobbylink/core/config.hpp"
#include "lobbylink/core/error.hpp"
#include "lobbylink/core/options.hpp"
#include "lobbylink/session/peer_session_manager.hpp"
#include "lobbylink/signaling/signaling_channel.hpp"
#include "lobbylink/storage/file_store.hpp"
#include "lobbylink/storage/share_catalog.hpp"
#include "lobbylink/transfer/transfer_engine.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lobbylink::lobby {

struct LobbyOptions {
    core::SignalingOptions signaling;
    core::SessionOptions session;
    core::TransferOptions transfer;

    static LobbyOptions from_config(const core::Config& config);
};

// Display side of the client: roster, chat, shares and transfer progress.
class LobbyObserver {
public:
    virtual ~LobbyObserver() = default;

    virtual void on_registered(const core::Result& /*result*/) {}
    virtual void on_player_joined(const signaling::PlayerInfo& /*player*/) {}
    virtual void on_player_left(const std::string& /*player_id*/) {}
    virtual void on_player_status(const std::string& /*player_id*/, bool /*mic_enabled*/) {}
    virtual void on_remote_audio(const std::string& /*player_id*/, std::shared_ptr<rtc::AudioTrack> /*track*/) {}
    virtual void on_chat(const signaling::ChatMessage& /*message*/) {}
    virtual void on_share_changed(const signaling::ShareInfo& /*share*/, bool /*removed*/) {}
    virtual void on_transfer_progress(const transfer::TransferProgress& /*progress*/) {}
    virtual void on_fatal_error(const core::Result& /*error*/) {}
};

// A lobby member: signaling, one session per peer, the share catalog and the
// transfer engine, all driven by one io_context.
class LobbyClient : private session::SessionObserver {
public:
    using ResultHandler = std::function<void(const core::Result&)>;

    LobbyClient(boost::asio::io_context& io_context,
                std::unique_ptr<signaling::SignalingTransport> signaling_transport,
                rtc::PeerConnectionFactory& connection_factory,
                rtc::MediaSource* media,
                storage::FileStore& file_store,
                const session::LocalIdentity& identity,
                const LobbyOptions& options);
    ~LobbyClient() override;

    LobbyClient(const LobbyClient&) = delete;
    LobbyClient& operator=(const LobbyClient&) = delete;

    void join(const std::string& url, ResultHandler handler);
    void leave();

    void set_observer(LobbyObserver* observer);

    core::Result share_folder(const std::string& share_id, const std::string& name,
                              const std::filesystem::path& folder,
                              std::optional<std::int64_t> expire_time = std::nullopt);
    core::Result update_share(const storage::SharedFolder& share);
    core::Result unshare(const std::string& share_id);

    std::string download(const transfer::FileDescriptor& file, const std::filesystem::path& save_path);
    core::Result cancel_transfer(const std::string& request_id);

    core::Result set_mic_enabled(bool enabled) { return sessions_.set_mic_enabled(enabled); }
    core::Result send_chat(const std::string& content) { return sessions_.send_chat(content); }

    const session::LocalIdentity& identity() const { return identity_; }
    session::PeerSessionManager& sessions() { return sessions_; }
    transfer::TransferEngine& transfers() { return engine_; }
    storage::ShareCatalog& catalog() { return catalog_; }
    signaling::SignalingChannel& signaling() { return signaling_; }

private:
    void announce_shares();

    void on_registration(const core::Result& result) override;
    void on_signaling_error(const core::Result& error) override;
    void on_version_error(const signaling::VersionTooOld& notice) override;
    void on_peer_joined(const signaling::PlayerInfo& player) override;
    void on_peer_left(const std::string& peer_id) override;
    void on_peer_status(const std::string& peer_id, bool mic_enabled) override;
    void on_remote_stream(const std::string& peer_id, std::shared_ptr<rtc::AudioTrack> track) override;
    void on_chat(const signaling::ChatMessage& message) override;
    void on_transport_created(const std::string& peer_id,
                              std::shared_ptr<transport::DataChannelTransport> transport) override;
    void on_session_removed(const std::string& peer_id) override;

    session::LocalIdentity identity_;
    LobbyOptions options_;

    LobbyObserver default_observer_;
    LobbyObserver* observer_;

    storage::ShareCatalog catalog_;
    signaling::SignalingChannel signaling_;
    session::PeerSessionManager sessions_;
    transfer::TransferEngine engine_;
};

} // namespace lobbylink::lobby
