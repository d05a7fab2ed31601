#pragma once

#include "lobbylink/signaling/signaling_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>
#include <optional>
#include <queue>
#include <string>

namespace lobbylink::signaling {

struct WebSocketUrl {
    std::string host;
    std::string port;
    std::string target;

    // Accepts ws://host[:port][/path]. Returns std::nullopt for anything else.
    static std::optional<WebSocketUrl> parse(const std::string& url);
};

class WebSocketTransport : public SignalingTransport {
public:
    explicit WebSocketTransport(boost::asio::io_context& io_context);
    ~WebSocketTransport() override;

    void open(const std::string& url, OpenHandler handler) override;
    void send(std::string text) override;
    void close() override;
    bool is_open() const override;

private:
    class Session;

    boost::asio::io_context& io_context_;
    std::shared_ptr<Session> session_;
};

}
