#include "lobbylink/signaling/signaling_channel.hpp"
#include "lobbylink/core/logger.hpp"
#include <algorithm>

namespace lobbylink::signaling {

SignalingChannel::SignalingChannel(boost::asio::io_context& io_context,
                                   std::unique_ptr<SignalingTransport> transport,
                                   const core::SignalingOptions& options)
    : transport_(std::move(transport))
    , options_(options)
    , reconnect_timer_(io_context)
    , connected_(false)
    , intentional_disconnect_(false)
    , reconnect_attempts_(0)
{
    transport_->set_message_handler([this](const std::string& text) { handle_text(text); });
    transport_->set_close_handler([this](const boost::system::error_code& ec) { handle_close(ec); });
}

SignalingChannel::~SignalingChannel() {
    intentional_disconnect_ = true;
    reconnect_timer_.cancel();
    transport_->set_message_handler(nullptr);
    transport_->set_close_handler(nullptr);
    transport_->close();
}

void SignalingChannel::connect(const std::string& url, ResultHandler handler) {
    url_ = url;
    intentional_disconnect_ = false;
    reconnect_timer_.cancel();

    LOG_INFO("Connecting to signaling server {}", url_);
    transport_->open(url_, [this, handler = std::move(handler)](const boost::system::error_code& ec) {
        if (ec) {
            LOG_ERROR("Signaling connection to {} failed: {}", url_, ec.message());
            handler(core::Result(core::ErrorCode::SIGNALING_UNAVAILABLE, ec.message()));
            return;
        }

        connected_ = true;
        reconnect_attempts_ = 0;
        LOG_INFO("Signaling connection established");
        handler(core::Result());
    });
}

core::Result SignalingChannel::register_client(const RegisterMessage& registration) {
    registration_ = registration;
    LOG_INFO("Registering {} ({}) in lobby '{}'", registration.client_id,
             registration.player_name, registration.lobby_name);
    return send(registration);
}

core::Result SignalingChannel::send(const SignalingMessage& message) {
    if (!connected_ || !transport_->is_open()) {
        LOG_WARN("Cannot send {}: signaling not connected", SignalingCodec::type_name(message));
        return core::Result(core::ErrorCode::SIGNALING_UNAVAILABLE, "Signaling not connected");
    }

    LOG_TRACE("Signaling send: {}", SignalingCodec::type_name(message));
    transport_->send(SignalingCodec::encode(message));
    return core::Result();
}

void SignalingChannel::disconnect() {
    intentional_disconnect_ = true;
    reconnect_timer_.cancel();

    if (connected_ && registration_) {
        if (auto result = send(LeaveMessage{registration_->client_id}); !result) {
            LOG_DEBUG("Leave notice not sent: {}", result.describe());
        }
    }

    connected_ = false;
    transport_->close();
    LOG_INFO("Signaling disconnected");
}

std::chrono::milliseconds SignalingChannel::backoff_delay(int attempt, const core::SignalingOptions& options) {
    if (attempt < 1) {
        attempt = 1;
    }
    auto delay = options.reconnect_base.count();
    for (int i = 1; i < attempt && delay < options.reconnect_cap.count(); ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<std::int64_t>(delay, options.reconnect_cap.count()));
}

void SignalingChannel::handle_text(const std::string& text) {
    std::optional<SignalingMessage> message;
    try {
        message = SignalingCodec::decode(text);
    } catch (const core::ProtocolError& e) {
        LOG_ERROR("Dropping malformed signaling message: {}", e.what());
        return;
    }

    if (!message) {
        LOG_DEBUG("Ignoring signaling message of unknown type");
        return;
    }

    if (auto* version = std::get_if<VersionTooOld>(&*message)) {
        LOG_CRITICAL("Client version {} rejected, minimum is {}", version->current_version,
                     version->minimum_version);
        intentional_disconnect_ = true;
        reconnect_timer_.cancel();
        connected_ = false;
        transport_->close();
        dispatch(*message);
        report_error(core::Result(core::ErrorCode::VERSION_TOO_OLD,
                                  "Minimum supported version is " + version->minimum_version));
        return;
    }

    if (auto* error = std::get_if<RegisterError>(&*message)) {
        LOG_WARN("Registration rejected: {}", error->message);
    } else if (std::holds_alternative<RegisterSuccess>(*message)) {
        LOG_INFO("Registration accepted, lobby id {}", std::get<RegisterSuccess>(*message).lobby_id);
    }

    dispatch(*message);
}

void SignalingChannel::dispatch(const SignalingMessage& message) {
    auto it = handlers_.find(message.index());
    if (it == handlers_.end()) {
        LOG_DEBUG("No subscriber for {}", SignalingCodec::type_name(message));
        return;
    }

    // Copy so a handler may subscribe without invalidating the iteration
    auto handlers = it->second;
    for (const auto& handler : handlers) {
        try {
            handler(message);
        } catch (const std::exception& e) {
            LOG_ERROR("Error handling {}: {}", SignalingCodec::type_name(message), e.what());
        }
    }
}

void SignalingChannel::handle_close(const boost::system::error_code& ec) {
    connected_ = false;

    if (intentional_disconnect_) {
        LOG_DEBUG("Signaling closed intentionally");
        return;
    }

    LOG_WARN("Signaling connection lost: {}", ec ? ec.message() : std::string("closed by server"));
    schedule_reconnect();
}

void SignalingChannel::schedule_reconnect() {
    if (reconnect_attempts_ >= options_.max_reconnect_attempts) {
        LOG_ERROR("Giving up on signaling after {} reconnect attempts", reconnect_attempts_);
        report_error(core::Result(core::ErrorCode::SIGNALING_UNAVAILABLE,
                                  "Reconnect attempts exhausted"));
        return;
    }

    ++reconnect_attempts_;
    auto delay = backoff_delay(reconnect_attempts_, options_);
    LOG_INFO("Reconnecting to signaling in {}ms (attempt {}/{})", delay.count(),
             reconnect_attempts_, options_.max_reconnect_attempts);

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || intentional_disconnect_) {
            return;
        }
        attempt_reconnect();
    });
}

void SignalingChannel::attempt_reconnect() {
    transport_->open(url_, [this](const boost::system::error_code& ec) {
        if (intentional_disconnect_) {
            return;
        }
        if (ec) {
            LOG_WARN("Signaling reconnect failed: {}", ec.message());
            schedule_reconnect();
            return;
        }

        connected_ = true;
        intentional_disconnect_ = false;
        LOG_INFO("Signaling reconnected after {} attempt(s)", reconnect_attempts_);
        reconnect_attempts_ = 0;

        if (registration_) {
            if (auto result = send(*registration_); !result) {
                LOG_ERROR("Re-registration failed: {}", result.describe());
            }
        }
    });
}

void SignalingChannel::report_error(const core::Result& result) {
    if (error_handler_) {
        error_handler_(result);
    }
}

}
