#include "lobbylink/rtc/libdatachannel_backend.hpp"
#include "lobbylink/core/logger.hpp"
#include <rtc/rtc.hpp>
#include <cstddef>
#include <mutex>

namespace lobbylink::rtc {

namespace {

PeerConnectionState map_state(::rtc::PeerConnection::State state) {
    switch (state) {
        case ::rtc::PeerConnection::State::New: return PeerConnectionState::NEW;
        case ::rtc::PeerConnection::State::Connecting: return PeerConnectionState::CONNECTING;
        case ::rtc::PeerConnection::State::Connected: return PeerConnectionState::CONNECTED;
        case ::rtc::PeerConnection::State::Disconnected: return PeerConnectionState::DISCONNECTED;
        case ::rtc::PeerConnection::State::Failed: return PeerConnectionState::FAILED;
        case ::rtc::PeerConnection::State::Closed: return PeerConnectionState::CLOSED;
    }
    return PeerConnectionState::CLOSED;
}

std::vector<std::uint8_t> to_bytes(const ::rtc::binary& data) {
    std::vector<std::uint8_t> bytes(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        bytes[i] = std::to_integer<std::uint8_t>(data[i]);
    }
    return bytes;
}

class LibDataChannel : public DataChannel, public std::enable_shared_from_this<LibDataChannel> {
public:
    LibDataChannel(boost::asio::io_context& io_context, std::shared_ptr<::rtc::DataChannel> channel)
        : io_context_(io_context)
        , channel_(std::move(channel))
        , label_(channel_->label()) {}

    ~LibDataChannel() override {
        channel_->onOpen(nullptr);
        channel_->onClosed(nullptr);
        channel_->onMessage(nullptr);
        channel_->onBufferedAmountLow(nullptr);
    }

    static std::shared_ptr<LibDataChannel> wrap(boost::asio::io_context& io_context,
                                                std::shared_ptr<::rtc::DataChannel> channel) {
        auto wrapper = std::make_shared<LibDataChannel>(io_context, std::move(channel));
        wrapper->bind();
        return wrapper;
    }

    const std::string& label() const override { return label_; }

    ReadyState ready_state() const override {
        if (channel_->isOpen()) {
            return ReadyState::OPEN;
        }
        if (channel_->isClosed()) {
            return ReadyState::CLOSED;
        }
        return closing_ ? ReadyState::CLOSING : ReadyState::CONNECTING;
    }

    std::size_t buffered_amount() const override { return channel_->bufferedAmount(); }
    std::size_t max_message_size() const override { return channel_->maxMessageSize(); }

    bool send(std::span<const std::uint8_t> data) override {
        try {
            return channel_->send(reinterpret_cast<const std::byte*>(data.data()), data.size());
        } catch (const std::exception& e) {
            LOG_WARN("Send on '{}' failed: {}", label_, e.what());
            return false;
        }
    }

    bool send(const std::string& text) override {
        try {
            return channel_->send(text);
        } catch (const std::exception& e) {
            LOG_WARN("Send on '{}' failed: {}", label_, e.what());
            return false;
        }
    }

    void close() override {
        closing_ = true;
        channel_->close();
    }

private:
    void bind() {
        std::weak_ptr<LibDataChannel> weak = shared_from_this();

        channel_->onOpen([this, weak] {
            boost::asio::post(io_context_, [weak] {
                if (auto self = weak.lock(); self && self->open_handler_) {
                    self->open_handler_();
                }
            });
        });
        channel_->onClosed([this, weak] {
            boost::asio::post(io_context_, [weak] {
                if (auto self = weak.lock(); self && self->close_handler_) {
                    self->close_handler_();
                }
            });
        });
        channel_->onBufferedAmountLow([this, weak] {
            boost::asio::post(io_context_, [weak] {
                if (auto self = weak.lock(); self && self->buffered_low_handler_) {
                    self->buffered_low_handler_();
                }
            });
        });
        channel_->onMessage([this, weak](::rtc::message_variant message) {
            if (auto* binary = std::get_if<::rtc::binary>(&message)) {
                boost::asio::post(io_context_, [weak, bytes = to_bytes(*binary)]() mutable {
                    if (auto self = weak.lock(); self && self->binary_handler_) {
                        self->binary_handler_(std::move(bytes));
                    }
                });
            } else if (auto* text = std::get_if<std::string>(&message)) {
                boost::asio::post(io_context_, [weak, text = std::move(*text)]() mutable {
                    if (auto self = weak.lock(); self && self->text_handler_) {
                        self->text_handler_(std::move(text));
                    }
                });
            }
        });
    }

    boost::asio::io_context& io_context_;
    std::shared_ptr<::rtc::DataChannel> channel_;
    std::string label_;
    bool closing_ = false;
};

class LibAudioTrack : public AudioTrack {
public:
    explicit LibAudioTrack(std::shared_ptr<::rtc::Track> track)
        : track_(std::move(track)) {
        track_->onMessage([this](::rtc::message_variant message) {
            auto* binary = std::get_if<::rtc::binary>(&message);
            if (!binary) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            if (sink_) {
                sink_(to_bytes(*binary));
            }
        });
    }

    ~LibAudioTrack() override {
        track_->onMessage(nullptr);
    }

    std::string id() const override { return track_->mid(); }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        sink_ = nullptr;
    }

    bool is_stopped() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    void set_packet_sink(AudioPacketSink sink) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

private:
    std::shared_ptr<::rtc::Track> track_;
    mutable std::mutex mutex_;
    AudioPacketSink sink_;
    bool stopped_ = false;
};

class LibPeerConnection : public PeerConnection, public std::enable_shared_from_this<LibPeerConnection> {
public:
    LibPeerConnection(boost::asio::io_context& io_context, std::string peer_id,
                      const RtcConfiguration& configuration)
        : io_context_(io_context)
        , peer_id_(std::move(peer_id)) {
        ::rtc::Configuration config;
        for (const auto& server : configuration.ice_servers) {
            config.iceServers.emplace_back(server);
        }
        if (configuration.max_message_size) {
            config.maxMessageSize = *configuration.max_message_size;
        }
        // Offers and answers are driven explicitly by the session manager
        config.disableAutoNegotiation = true;
        pc_ = std::make_shared<::rtc::PeerConnection>(config);
    }

    ~LibPeerConnection() override {
        pc_->onLocalCandidate(nullptr);
        pc_->onStateChange(nullptr);
        pc_->onDataChannel(nullptr);
        pc_->onTrack(nullptr);
    }

    void bind() {
        std::weak_ptr<LibPeerConnection> weak = shared_from_this();

        pc_->onLocalCandidate([this, weak](::rtc::Candidate candidate) {
            IceCandidate converted;
            converted.candidate = std::string(candidate);
            converted.sdp_mid = candidate.mid();
            boost::asio::post(io_context_, [weak, converted] {
                if (auto self = weak.lock(); self && self->candidate_handler_) {
                    self->candidate_handler_(converted);
                }
            });
        });

        pc_->onStateChange([this, weak](::rtc::PeerConnection::State state) {
            auto mapped = map_state(state);
            boost::asio::post(io_context_, [weak, mapped] {
                if (auto self = weak.lock(); self && self->state_handler_) {
                    self->state_handler_(mapped);
                }
            });
        });

        pc_->onDataChannel([this, weak](std::shared_ptr<::rtc::DataChannel> channel) {
            // Wrap right away so no message is missed before the handler runs
            auto wrapped = LibDataChannel::wrap(io_context_, std::move(channel));
            boost::asio::post(io_context_, [weak, wrapped] {
                if (auto self = weak.lock(); self && self->data_channel_handler_) {
                    self->data_channel_handler_(wrapped);
                }
            });
        });

        pc_->onTrack([this, weak](std::shared_ptr<::rtc::Track> track) {
            if (track->description().type() != "audio") {
                return;
            }
            auto wrapped = std::make_shared<LibAudioTrack>(std::move(track));
            boost::asio::post(io_context_, [weak, wrapped] {
                if (auto self = weak.lock(); self && self->track_handler_) {
                    self->track_handler_(wrapped);
                }
            });
        });
    }

    void create_offer(bool ice_restart, DescriptionHandler handler) override {
        // A recreated connection already carries fresh ICE credentials
        if (ice_restart) {
            LOG_DEBUG("Offer to {} on a fresh connection (ICE restart)", peer_id_);
        }
        create_local(::rtc::Description::Type::Offer, std::move(handler));
    }

    void create_answer(DescriptionHandler handler) override {
        create_local(::rtc::Description::Type::Answer, std::move(handler));
    }

    core::Result set_remote_description(const SessionDescription& description) override {
        try {
            pc_->setRemoteDescription(::rtc::Description(description.sdp, description.type));
        } catch (const std::exception& e) {
            return core::Result(core::ErrorCode::NEGOTIATION_FAILED, e.what());
        }
        return core::Result();
    }

    core::Result add_remote_candidate(const IceCandidate& candidate) override {
        try {
            pc_->addRemoteCandidate(::rtc::Candidate(candidate.candidate, candidate.sdp_mid));
        } catch (const std::exception& e) {
            return core::Result(core::ErrorCode::NEGOTIATION_FAILED, e.what());
        }
        return core::Result();
    }

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label,
                                                     const DataChannelInit& init) override {
        ::rtc::DataChannelInit dc_init;
        dc_init.reliability.unordered = !init.ordered;
        if (init.max_retransmits) {
            dc_init.reliability.maxRetransmits = static_cast<unsigned int>(*init.max_retransmits);
        }
        if (init.max_packet_lifetime) {
            dc_init.reliability.maxPacketLifeTime = *init.max_packet_lifetime;
        }

        auto channel = pc_->createDataChannel(label, dc_init);
        if (init.buffered_amount_low_threshold > 0) {
            channel->setBufferedAmountLowThreshold(init.buffered_amount_low_threshold);
        }
        return LibDataChannel::wrap(io_context_, std::move(channel));
    }

    void add_audio_sender() override {
        ::rtc::Description::Audio audio("audio", ::rtc::Description::Direction::SendRecv);
        audio.addOpusCodec(111);
        sender_ = pc_->addTrack(audio);
    }

    core::Result replace_audio_track(std::shared_ptr<AudioTrack> track) override {
        if (!sender_) {
            return core::Result(core::ErrorCode::INVALID_STATE, "No audio sender");
        }

        if (current_track_) {
            current_track_->set_packet_sink(nullptr);
        }
        current_track_ = track;

        if (track) {
            std::weak_ptr<::rtc::Track> sender = sender_;
            track->set_packet_sink([sender](const std::vector<std::uint8_t>& packet) {
                auto target = sender.lock();
                if (!target || !target->isOpen()) {
                    return;
                }
                try {
                    target->send(reinterpret_cast<const std::byte*>(packet.data()), packet.size());
                } catch (const std::exception& e) {
                    LOG_TRACE("Audio packet dropped: {}", e.what());
                }
            });
        }
        return core::Result();
    }

    PeerConnectionState state() const override { return map_state(pc_->state()); }

    void close() override {
        if (current_track_) {
            current_track_->set_packet_sink(nullptr);
            current_track_.reset();
        }
        pc_->close();
    }

private:
    void create_local(::rtc::Description::Type type, DescriptionHandler handler) {
        core::Result result;
        SessionDescription description;
        try {
            pc_->setLocalDescription(type);
            auto local = pc_->localDescription();
            if (local) {
                description.type = local->typeString();
                description.sdp = std::string(*local);
            } else {
                result = core::Result(core::ErrorCode::NEGOTIATION_FAILED, "No local description generated");
            }
        } catch (const std::exception& e) {
            result = core::Result(core::ErrorCode::NEGOTIATION_FAILED, e.what());
        }

        boost::asio::post(io_context_, [handler = std::move(handler), result, description] {
            handler(result, description);
        });
    }

    boost::asio::io_context& io_context_;
    std::string peer_id_;
    std::shared_ptr<::rtc::PeerConnection> pc_;
    std::shared_ptr<::rtc::Track> sender_;
    std::shared_ptr<AudioTrack> current_track_;
};

}

LibDataChannelFactory::LibDataChannelFactory(boost::asio::io_context& io_context, RtcConfiguration configuration)
    : io_context_(io_context)
    , configuration_(std::move(configuration)) {}

std::shared_ptr<PeerConnection> LibDataChannelFactory::create(const std::string& peer_id) {
    try {
        auto connection = std::make_shared<LibPeerConnection>(io_context_, peer_id, configuration_);
        connection->bind();
        return connection;
    } catch (const std::exception& e) {
        LOG_ERROR("libdatachannel could not create a connection for {}: {}", peer_id, e.what());
        return nullptr;
    }
}

void LibDataChannelFactory::init_logging() {
    ::rtc::InitLogger(::rtc::LogLevel::Warning, [](::rtc::LogLevel level, std::string message) {
        switch (level) {
            case ::rtc::LogLevel::Fatal:
            case ::rtc::LogLevel::Error:
                LOG_ERROR("libdatachannel: {}", message);
                break;
            case ::rtc::LogLevel::Warning:
                LOG_WARN("libdatachannel: {}", message);
                break;
            default:
                LOG_DEBUG("libdatachannel: {}", message);
                break;
        }
    });
}

} // namespace lobbylink::rtc
