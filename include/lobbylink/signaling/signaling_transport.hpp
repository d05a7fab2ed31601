#pragma once

#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace lobbylink::signaling {

// Ordered text-message connection to the signaling server.
class SignalingTransport {
public:
    using OpenHandler = std::function<void(const boost::system::error_code&)>;
    using MessageHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const boost::system::error_code&)>;

    virtual ~SignalingTransport() = default;

    virtual void open(const std::string& url, OpenHandler handler) = 0;
    virtual void send(std::string text) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }

    // Invoked once when an open connection ends, whoever closed it.
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }

protected:
    MessageHandler message_handler_;
    CloseHandler close_handler_;
};

}
