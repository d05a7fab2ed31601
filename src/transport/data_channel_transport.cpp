#include "lobbylink/transport/data_channel_transport.hpp"
#include "lobbylink/core/logger.hpp"
#include <fmt/format.h>

namespace lobbylink::transport {

DataChannelTransport::DataChannelTransport(boost::asio::io_context& io_context, std::string peer_id,
                                           const core::TransportOptions& options)
    : io_context_(io_context)
    , peer_id_(std::move(peer_id))
    , options_(options)
    , retry_timer_(io_context)
    , retry_scheduled_(false)
    , pumping_(false)
    , ready_notified_(false)
{
}

DataChannelTransport::~DataChannelTransport() {
    retry_timer_.cancel();
    for (auto* channel : {control_channel_.get(), transfer_channel_.get()}) {
        if (channel) {
            channel->on_open(nullptr);
            channel->on_close(nullptr);
            channel->on_binary(nullptr);
            channel->on_text(nullptr);
            channel->on_buffered_amount_low(nullptr);
        }
    }
}

rtc::DataChannelInit DataChannelTransport::control_channel_init(const core::TransportOptions& options) {
    rtc::DataChannelInit init;
    init.ordered = true;
    init.max_retransmits = options.control_max_retransmits;
    return init;
}

rtc::DataChannelInit DataChannelTransport::transfer_channel_init(const core::TransportOptions& options) {
    rtc::DataChannelInit init;
    init.ordered = false;
    init.max_packet_lifetime = options.transfer_max_packet_lifetime;
    init.buffered_amount_low_threshold = options.buffered_amount_low_threshold;
    return init;
}

void DataChannelTransport::attach_control_channel(std::shared_ptr<rtc::DataChannel> channel) {
    control_channel_ = std::move(channel);
    std::weak_ptr<DataChannelTransport> weak = shared_from_this();

    control_channel_->on_open([weak] {
        if (auto self = weak.lock()) {
            LOG_DEBUG("Control channel to {} open", self->peer_id_);
            self->handle_channel_open();
        }
    });
    control_channel_->on_close([weak] {
        if (auto self = weak.lock()) {
            LOG_DEBUG("Control channel to {} closed", self->peer_id_);
        }
    });
    control_channel_->on_text([weak](std::string text) {
        if (auto self = weak.lock()) {
            self->handle_text(text);
        }
    });

    if (control_channel_->is_open()) {
        handle_channel_open();
    }
}

void DataChannelTransport::attach_transfer_channel(std::shared_ptr<rtc::DataChannel> channel) {
    transfer_channel_ = std::move(channel);
    std::weak_ptr<DataChannelTransport> weak = shared_from_this();

    transfer_channel_->on_open([weak] {
        if (auto self = weak.lock()) {
            LOG_DEBUG("Transfer channel to {} open", self->peer_id_);
            self->handle_channel_open();
            self->pump();
        }
    });
    transfer_channel_->on_close([weak] {
        if (auto self = weak.lock()) {
            LOG_DEBUG("Transfer channel to {} closed", self->peer_id_);
            self->fail_pending(core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE,
                                            "Transfer channel closed"));
        }
    });
    transfer_channel_->on_binary([weak](std::vector<std::uint8_t> data) {
        if (auto self = weak.lock()) {
            self->handle_binary(std::move(data));
        }
    });
    transfer_channel_->on_buffered_amount_low([weak] {
        auto self = weak.lock();
        if (self && self->retry_scheduled_) {
            self->retry_timer_.cancel();
            self->retry_scheduled_ = false;
            self->pump();
        }
    });

    if (transfer_channel_->is_open()) {
        handle_channel_open();
    }
}

core::Result DataChannelTransport::send_control(const ControlMessage& message) {
    if (!is_control_open()) {
        return core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE,
                            "Control channel to " + peer_id_ + " is not open");
    }

    if (!control_channel_->send(ControlCodec::encode(message))) {
        return core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE, "Control channel send failed");
    }
    return core::Result();
}

void DataChannelTransport::send_frame(const TransferFrame& frame, SendHandler handler) {
    outbox_.push_back(PendingFrame{frame.request_id, frame.serialize(), std::move(handler)});
    pump();
}

std::size_t DataChannelTransport::drop_pending(const std::string& request_id) {
    const auto child_prefix = request_id + "-thread";
    std::size_t dropped = 0;

    for (auto it = outbox_.begin(); it != outbox_.end();) {
        if (it->request_id == request_id || it->request_id.starts_with(child_prefix)) {
            it = outbox_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        LOG_DEBUG("Dropped {} queued frame(s) for {}", dropped, request_id);
    }
    return dropped;
}

bool DataChannelTransport::is_control_open() const {
    return control_channel_ && control_channel_->is_open();
}

bool DataChannelTransport::is_transfer_open() const {
    return transfer_channel_ && transfer_channel_->is_open();
}

std::size_t DataChannelTransport::max_frame_size() const {
    return transfer_channel_ ? transfer_channel_->max_message_size() : 0;
}

void DataChannelTransport::close() {
    retry_timer_.cancel();
    fail_pending(core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE, "Transport closed"));

    if (control_channel_) {
        control_channel_->close();
    }
    if (transfer_channel_) {
        transfer_channel_->close();
    }
}

void DataChannelTransport::handle_channel_open() {
    if (ready_notified_ || !is_ready()) {
        return;
    }
    ready_notified_ = true;
    LOG_INFO("Data channels to {} ready", peer_id_);
    if (open_handler_) {
        open_handler_();
    }
}

void DataChannelTransport::handle_binary(std::vector<std::uint8_t> data) {
    TransferFrame frame;
    try {
        frame = TransferFrame::deserialize(data);
    } catch (const core::ProtocolError& e) {
        LOG_WARN("Discarding malformed frame from {}: {}", peer_id_, e.what());
        return;
    }

    if (frame_handler_) {
        frame_handler_(std::move(frame));
    }
}

void DataChannelTransport::handle_text(const std::string& text) {
    std::optional<ControlMessage> message;
    try {
        message = ControlCodec::decode(text);
    } catch (const core::ProtocolError& e) {
        LOG_WARN("Discarding malformed control message from {}: {}", peer_id_, e.what());
        return;
    }

    if (!message) {
        LOG_DEBUG("Ignoring unknown control message from {}", peer_id_);
        return;
    }

    if (control_handler_) {
        control_handler_(std::move(*message));
    }
}

void DataChannelTransport::pump() {
    if (pumping_ || retry_scheduled_) {
        return;
    }
    pumping_ = true;

    while (!outbox_.empty()) {
        if (!is_transfer_open()) {
            // A channel that never opened yet keeps its queue until on_open
            if (transfer_channel_ && transfer_channel_->ready_state() == rtc::ReadyState::CONNECTING) {
                break;
            }
            pumping_ = false;
            fail_pending(core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE,
                                      "Transfer channel to " + peer_id_ + " is not open"));
            return;
        }

        if (transfer_channel_->buffered_amount() > options_.high_water_mark) {
            LOG_TRACE("Backpressure on {}: {} bytes buffered", peer_id_,
                      transfer_channel_->buffered_amount());
            retry_scheduled_ = true;
            retry_timer_.expires_after(options_.backpressure_retry);
            std::weak_ptr<DataChannelTransport> weak = shared_from_this();
            retry_timer_.async_wait([weak](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->retry_scheduled_ = false;
                    self->pump();
                }
            });
            break;
        }

        auto frame = std::move(outbox_.front());
        outbox_.pop_front();

        core::Result result;
        const auto limit = transfer_channel_->max_message_size();
        if (frame.bytes.size() > limit) {
            LOG_WARN("Frame for {} is {} bytes, {} accepts at most {}", frame.request_id,
                     frame.bytes.size(), peer_id_, limit);
            result = core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE,
                                  fmt::format("Frame of {} bytes exceeds the channel limit of {}",
                                              frame.bytes.size(), limit));
        } else if (!transfer_channel_->send(frame.bytes)) {
            result = core::Result(core::ErrorCode::CHANNEL_UNAVAILABLE, "Transfer channel send failed");
        }
        if (frame.handler) {
            frame.handler(result);
        }
    }

    pumping_ = false;
}

void DataChannelTransport::fail_pending(const core::Result& result) {
    auto pending = std::move(outbox_);
    outbox_.clear();

    for (auto& frame : pending) {
        if (frame.handler) {
            frame.handler(result);
        }
    }
}

}
