#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/core/options.hpp"
#include "lobbylink/rtc/data_channel.hpp"
#include "lobbylink/rtc/rtc_types.hpp"
#include "lobbylink/transport/control_messages.hpp"
#include "lobbylink/transport/frame_codec.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace lobbylink::transport {

constexpr const char* CONTROL_CHANNEL_LABEL = "status";
constexpr const char* TRANSFER_CHANNEL_LABEL = "file-transfer";

// Per-peer pair of data channels: an ordered control channel carrying JSON
// and an unordered transfer channel carrying binary frames. Frames go through
// an outbox that is only drained while the channel's buffered amount stays
// below the high-water mark.
class DataChannelTransport : public std::enable_shared_from_this<DataChannelTransport> {
public:
    using SendHandler = std::function<void(const core::Result&)>;
    using FrameHandler = std::function<void(TransferFrame)>;
    using ControlHandler = std::function<void(ControlMessage)>;
    using OpenHandler = std::function<void()>;

    DataChannelTransport(boost::asio::io_context& io_context, std::string peer_id,
                         const core::TransportOptions& options);
    ~DataChannelTransport();

    static rtc::DataChannelInit control_channel_init(const core::TransportOptions& options);
    static rtc::DataChannelInit transfer_channel_init(const core::TransportOptions& options);

    void attach_control_channel(std::shared_ptr<rtc::DataChannel> channel);
    void attach_transfer_channel(std::shared_ptr<rtc::DataChannel> channel);

    core::Result send_control(const ControlMessage& message);

    // The handler runs once the frame was handed to the channel, or failed.
    void send_frame(const TransferFrame& frame, SendHandler handler = {});

    // Drops queued frames of request_id and of its "<request_id>-thread<N>" children.
    std::size_t drop_pending(const std::string& request_id);

    void set_frame_handler(FrameHandler handler) { frame_handler_ = std::move(handler); }
    void set_control_handler(ControlHandler handler) { control_handler_ = std::move(handler); }

    // Invoked when both channels are open.
    void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }

    bool is_control_open() const;
    bool is_transfer_open() const;
    bool is_ready() const { return is_control_open() && is_transfer_open(); }
    std::size_t pending_frames() const { return outbox_.size(); }
    // Largest frame the transfer channel accepts, 0 while it is not attached.
    std::size_t max_frame_size() const;
    const std::string& peer_id() const { return peer_id_; }

    void close();

private:
    struct PendingFrame {
        std::string request_id;
        std::vector<std::uint8_t> bytes;
        SendHandler handler;
    };

    void handle_channel_open();
    void handle_binary(std::vector<std::uint8_t> data);
    void handle_text(const std::string& text);
    void pump();
    void fail_pending(const core::Result& result);

    boost::asio::io_context& io_context_;
    std::string peer_id_;
    core::TransportOptions options_;

    std::shared_ptr<rtc::DataChannel> control_channel_;
    std::shared_ptr<rtc::DataChannel> transfer_channel_;

    std::deque<PendingFrame> outbox_;
    boost::asio::steady_timer retry_timer_;
    bool retry_scheduled_;
    bool pumping_;
    bool ready_notified_;

    FrameHandler frame_handler_;
    ControlHandler control_handler_;
    OpenHandler open_handler_;
};

}
