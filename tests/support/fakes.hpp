#pragma once

#include "lobbylink/rtc/data_channel.hpp"
#include "lobbylink/rtc/media.hpp"
#include "lobbylink/rtc/peer_connection.hpp"
#include "lobbylink/signaling/signaling_messages.hpp"
#include "lobbylink/signaling/signaling_transport.hpp"
#include "lobbylink/storage/file_store.hpp"
#include "lobbylink/transfer/transfer_engine.hpp"
#include "lobbylink/transport/data_channel_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lobbylink::testing {

// In-memory data channel. Two channels can be linked so that whatever one
// sends is delivered to the other on the next io_context turn.
class FakeDataChannel : public rtc::DataChannel, public std::enable_shared_from_this<FakeDataChannel> {
public:
    FakeDataChannel(boost::asio::io_context& io_context, std::string label)
        : io_context_(io_context), label_(std::move(label)) {}

    static void link(const std::shared_ptr<FakeDataChannel>& a, const std::shared_ptr<FakeDataChannel>& b) {
        a->remote_ = b;
        b->remote_ = a;
    }

    const std::string& label() const override { return label_; }
    rtc::ReadyState ready_state() const override { return state_; }
    std::size_t buffered_amount() const override { return buffered_; }
    std::size_t max_message_size() const override { return message_limit; }

    bool send(std::span<const std::uint8_t> data) override {
        if (state_ != rtc::ReadyState::OPEN || fail_sends || data.size() > message_limit) {
            return false;
        }
        std::vector<std::uint8_t> bytes(data.begin(), data.end());
        sent_binary.push_back(bytes);
        buffered_ += grow_buffer_by;
        if (auto remote = remote_.lock()) {
            boost::asio::post(io_context_, [remote, bytes = std::move(bytes)]() mutable {
                remote->deliver_binary(std::move(bytes));
            });
        }
        return true;
    }

    bool send(const std::string& text) override {
        if (state_ != rtc::ReadyState::OPEN || fail_sends || text.size() > message_limit) {
            return false;
        }
        sent_text.push_back(text);
        if (auto remote = remote_.lock()) {
            boost::asio::post(io_context_, [remote, text] { remote->deliver_text(text); });
        }
        return true;
    }

    void close() override {
        if (state_ == rtc::ReadyState::CLOSED) {
            return;
        }
        state_ = rtc::ReadyState::CLOSED;
        if (close_handler_) {
            close_handler_();
        }
    }

    void open() {
        state_ = rtc::ReadyState::OPEN;
        if (open_handler_) {
            open_handler_();
        }
    }

    void drain(std::size_t remaining = 0) {
        buffered_ = remaining;
        if (buffered_low_handler_) {
            buffered_low_handler_();
        }
    }

    void set_buffered_amount(std::size_t amount) { buffered_ = amount; }

    void deliver_binary(std::vector<std::uint8_t> data) {
        if (binary_handler_) {
            binary_handler_(std::move(data));
        }
    }

    void deliver_text(const std::string& text) {
        if (text_handler_) {
            text_handler_(text);
        }
    }

    std::vector<std::vector<std::uint8_t>> sent_binary;
    std::vector<std::string> sent_text;
    std::size_t grow_buffer_by = 0;
    bool fail_sends = false;
    std::size_t message_limit = core::TransportOptions{}.max_message_size;

private:
    boost::asio::io_context& io_context_;
    std::string label_;
    rtc::ReadyState state_ = rtc::ReadyState::CONNECTING;
    std::size_t buffered_ = 0;
    std::weak_ptr<FakeDataChannel> remote_;
};

class FakeAudioTrack : public rtc::AudioTrack {
public:
    explicit FakeAudioTrack(std::string id) : id_(std::move(id)) {}

    std::string id() const override { return id_; }
    void stop() override { stopped_ = true; }
    bool is_stopped() const override { return stopped_; }
    void set_packet_sink(rtc::AudioPacketSink sink) override { sink_ = std::move(sink); }

private:
    std::string id_;
    bool stopped_ = false;
    rtc::AudioPacketSink sink_;
};

class FakeMediaSource : public rtc::MediaSource {
public:
    std::shared_ptr<rtc::AudioTrack> capture_audio() override {
        if (unavailable) {
            return nullptr;
        }
        auto track = std::make_shared<FakeAudioTrack>("mic-" + std::to_string(++captures));
        tracks.push_back(track);
        return track;
    }

    std::vector<std::shared_ptr<FakeAudioTrack>> tracks;
    int captures = 0;
    bool unavailable = false;
};

// Records every negotiation call. Descriptions are produced on the next
// io_context turn, like a real stack would.
class FakePeerConnection : public rtc::PeerConnection {
public:
    FakePeerConnection(boost::asio::io_context& io_context, std::string peer_id)
        : io_context_(io_context), peer_id_(std::move(peer_id)) {}

    void create_offer(bool ice_restart, DescriptionHandler handler) override {
        ++offers_created;
        last_offer_ice_restart = ice_restart;
        produce("offer", std::move(handler));
    }

    void create_answer(DescriptionHandler handler) override {
        ++answers_created;
        produce("answer", std::move(handler));
    }

    core::Result set_remote_description(const rtc::SessionDescription& description) override {
        if (fail_remote_description) {
            return core::Result(core::ErrorCode::NEGOTIATION_FAILED, "rejected description");
        }
        remote_descriptions.push_back(description);
        return core::Result();
    }

    core::Result add_remote_candidate(const rtc::IceCandidate& candidate) override {
        added_candidates.push_back(candidate);
        return core::Result();
    }

    std::shared_ptr<rtc::DataChannel> create_data_channel(const std::string& label,
                                                          const rtc::DataChannelInit& init) override {
        auto channel = std::make_shared<FakeDataChannel>(io_context_, label);
        channels[label] = channel;
        channel_inits[label] = init;
        return channel;
    }

    void add_audio_sender() override { ++audio_senders; }

    core::Result replace_audio_track(std::shared_ptr<rtc::AudioTrack> track) override {
        replaced_tracks.push_back(track);
        return core::Result();
    }

    rtc::PeerConnectionState state() const override { return state_; }

    void close() override {
        closed = true;
        state_ = rtc::PeerConnectionState::CLOSED;
    }

    void emit_state(rtc::PeerConnectionState state) {
        state_ = state;
        if (state_handler_) {
            state_handler_(state);
        }
    }

    void emit_candidate(const rtc::IceCandidate& candidate) {
        if (candidate_handler_) {
            candidate_handler_(candidate);
        }
    }

    void emit_data_channel(std::shared_ptr<rtc::DataChannel> channel) {
        if (data_channel_handler_) {
            data_channel_handler_(std::move(channel));
        }
    }

    void emit_track(std::shared_ptr<rtc::AudioTrack> track) {
        if (track_handler_) {
            track_handler_(std::move(track));
        }
    }

    const std::string& peer_id() const { return peer_id_; }

    int offers_created = 0;
    int answers_created = 0;
    bool last_offer_ice_restart = false;
    bool fail_remote_description = false;
    bool fail_local_description = false;
    bool closed = false;
    int audio_senders = 0;
    std::vector<rtc::SessionDescription> remote_descriptions;
    std::vector<rtc::IceCandidate> added_candidates;
    std::vector<std::shared_ptr<rtc::AudioTrack>> replaced_tracks;
    std::map<std::string, std::shared_ptr<FakeDataChannel>> channels;
    std::map<std::string, rtc::DataChannelInit> channel_inits;

private:
    void produce(const std::string& type, DescriptionHandler handler) {
        core::Result result;
        if (fail_local_description) {
            result = core::Result(core::ErrorCode::NEGOTIATION_FAILED, "no " + type);
        }
        rtc::SessionDescription description{type, type + "-sdp-" + std::to_string(++descriptions_)};
        boost::asio::post(io_context_, [handler = std::move(handler), result, description] {
            handler(result, description);
        });
    }

    boost::asio::io_context& io_context_;
    std::string peer_id_;
    rtc::PeerConnectionState state_ = rtc::PeerConnectionState::NEW;
    int descriptions_ = 0;
};

class FakePeerConnectionFactory : public rtc::PeerConnectionFactory {
public:
    explicit FakePeerConnectionFactory(boost::asio::io_context& io_context) : io_context_(io_context) {}

    std::shared_ptr<rtc::PeerConnection> create(const std::string& peer_id) override {
        if (fail_create) {
            return nullptr;
        }
        auto connection = std::make_shared<FakePeerConnection>(io_context_, peer_id);
        created[peer_id].push_back(connection);
        return connection;
    }

    std::shared_ptr<FakePeerConnection> latest(const std::string& peer_id) const {
        auto it = created.find(peer_id);
        if (it == created.end() || it->second.empty()) {
            return nullptr;
        }
        return it->second.back();
    }

    std::size_t count(const std::string& peer_id) const {
        auto it = created.find(peer_id);
        return it == created.end() ? 0 : it->second.size();
    }

    std::map<std::string, std::vector<std::shared_ptr<FakePeerConnection>>> created;
    bool fail_create = false;

private:
    boost::asio::io_context& io_context_;
};

// Signaling transport that keeps sent text and lets a test play the server.
class FakeSignalingTransport : public signaling::SignalingTransport {
public:
    explicit FakeSignalingTransport(boost::asio::io_context& io_context) : io_context_(io_context) {}

    void open(const std::string& url, OpenHandler handler) override {
        urls.push_back(url);
        boost::system::error_code ec;
        if (refuse_opens > 0) {
            --refuse_opens;
            ec = boost::asio::error::connection_refused;
        } else {
            open_ = true;
        }
        boost::asio::post(io_context_, [handler = std::move(handler), ec] { handler(ec); });
    }

    void send(std::string text) override { sent.push_back(std::move(text)); }

    void close() override {
        if (!open_) {
            return;
        }
        open_ = false;
        if (close_handler_) {
            close_handler_(boost::system::error_code());
        }
    }

    bool is_open() const override { return open_; }

    // Server side actions
    void deliver(const signaling::SignalingMessage& message) { deliver_raw(signaling::SignalingCodec::encode(message)); }

    void deliver_raw(const std::string& text) {
        if (message_handler_) {
            message_handler_(text);
        }
    }

    void drop_connection() {
        open_ = false;
        if (close_handler_) {
            close_handler_(boost::asio::error::connection_reset);
        }
    }

    template<typename T>
    std::vector<T> sent_of() const {
        std::vector<T> result;
        for (const auto& text : sent) {
            auto message = signaling::SignalingCodec::decode(text);
            if (message && std::holds_alternative<T>(*message)) {
                result.push_back(std::get<T>(*message));
            }
        }
        return result;
    }

    std::vector<std::string> urls;
    std::vector<std::string> sent;
    int refuse_opens = 0;

private:
    boost::asio::io_context& io_context_;
    bool open_ = false;
};

class MemoryFileStore : public storage::FileStore {
public:
    core::Result file_size(const std::filesystem::path& path, std::uint64_t& size) override {
        auto it = files.find(path.lexically_normal().string());
        if (it == files.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "No such file: " + path.string());
        }
        size = it->second.size();
        return core::Result();
    }

    core::Result read_range(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length,
                            std::vector<std::uint8_t>& data) override {
        ++reads;
        auto it = files.find(path.lexically_normal().string());
        if (it == files.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "No such file: " + path.string());
        }
        if (fail_reads || offset + length > it->second.size()) {
            return core::Result(core::ErrorCode::FILE_IO, "Short read");
        }
        data.assign(it->second.begin() + static_cast<std::ptrdiff_t>(offset),
                    it->second.begin() + static_cast<std::ptrdiff_t>(offset + length));
        return core::Result();
    }

    core::Result write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) override {
        if (fail_writes) {
            return core::Result(core::ErrorCode::FILE_IO, "Disk full");
        }
        files[path.lexically_normal().string()] = std::vector<std::uint8_t>(data.begin(), data.end());
        return core::Result();
    }

    void put(const std::filesystem::path& path, std::vector<std::uint8_t> data) {
        files[path.lexically_normal().string()] = std::move(data);
    }

    const std::vector<std::uint8_t>* get(const std::filesystem::path& path) const {
        auto it = files.find(path.lexically_normal().string());
        return it == files.end() ? nullptr : &it->second;
    }

    std::map<std::string, std::vector<std::uint8_t>> files;
    int reads = 0;
    bool fail_reads = false;
    bool fail_writes = false;
};

class MapTransportProvider : public transfer::TransportProvider {
public:
    std::shared_ptr<transport::DataChannelTransport> transport_for(const std::string& peer_id) override {
        auto it = transports.find(peer_id);
        return it == transports.end() ? nullptr : it->second;
    }

    std::map<std::string, std::shared_ptr<transport::DataChannelTransport>> transports;
};

// Two transports whose channels are linked back to back.
struct TransportPair {
    std::shared_ptr<transport::DataChannelTransport> a;
    std::shared_ptr<transport::DataChannelTransport> b;
    std::shared_ptr<FakeDataChannel> a_control;
    std::shared_ptr<FakeDataChannel> a_transfer;
    std::shared_ptr<FakeDataChannel> b_control;
    std::shared_ptr<FakeDataChannel> b_transfer;

    // a is the transport held by a_id to talk to b_id, and vice versa.
    static TransportPair make(boost::asio::io_context& io_context, const std::string& a_id,
                              const std::string& b_id, const core::TransportOptions& options = {}) {
        TransportPair pair;
        pair.a = std::make_shared<transport::DataChannelTransport>(io_context, b_id, options);
        pair.b = std::make_shared<transport::DataChannelTransport>(io_context, a_id, options);
        pair.a_control = std::make_shared<FakeDataChannel>(io_context, transport::CONTROL_CHANNEL_LABEL);
        pair.a_transfer = std::make_shared<FakeDataChannel>(io_context, transport::TRANSFER_CHANNEL_LABEL);
        pair.b_control = std::make_shared<FakeDataChannel>(io_context, transport::CONTROL_CHANNEL_LABEL);
        pair.b_transfer = std::make_shared<FakeDataChannel>(io_context, transport::TRANSFER_CHANNEL_LABEL);
        FakeDataChannel::link(pair.a_control, pair.b_control);
        FakeDataChannel::link(pair.a_transfer, pair.b_transfer);
        pair.a->attach_control_channel(pair.a_control);
        pair.a->attach_transfer_channel(pair.a_transfer);
        pair.b->attach_control_channel(pair.b_control);
        pair.b->attach_transfer_channel(pair.b_transfer);
        return pair;
    }

    void open() {
        a_control->open();
        a_transfer->open();
        b_control->open();
        b_transfer->open();
    }
};

inline std::vector<std::uint8_t> make_pattern(std::size_t size, std::uint32_t seed = 7) {
    std::vector<std::uint8_t> data(size);
    std::uint32_t state = seed;
    for (auto& byte : data) {
        state = state * 1103515245u + 12345u;
        byte = static_cast<std::uint8_t>(state >> 16);
    }
    return data;
}

} // namespace lobbylink::testing
