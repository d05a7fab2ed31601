#include <gtest/gtest.h>
#include "lobbylink/signaling/signaling_channel.hpp"
#include "lobbylink/signaling/websocket_transport.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

using namespace lobbylink;
using namespace lobbylink::signaling;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

// Single-connection signaling server on a loopback port. Answers a register
// message with register-success and records everything it reads.
class LoopbackSignalingServer {
public:
    explicit LoopbackSignalingServer(boost::asio::io_context& io_context)
        : acceptor_(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {}

    std::string url() const {
        return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/signaling";
    }

    void start() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(std::move(socket));
            ws_->async_accept([this](const boost::system::error_code& ec) {
                if (!ec) {
                    read();
                }
            });
        });
    }

    std::vector<std::string> received;

private:
    void read() {
        ws_->async_read(buffer_, [this](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                return;
            }
            auto text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            received.push_back(text);

            auto message = SignalingCodec::decode(text);
            if (!message || !std::holds_alternative<RegisterMessage>(*message)) {
                read();
                return;
            }

            reply_ = SignalingCodec::encode(RegisterSuccess{"lobby-7"});
            ws_->text(true);
            ws_->async_write(boost::asio::buffer(reply_), [this](const boost::system::error_code& ec, std::size_t) {
                if (!ec) {
                    read();
                }
            });
        });
    }

    tcp::acceptor acceptor_;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;
    std::string reply_;
};

RegisterMessage registration() {
    RegisterMessage message;
    message.client_id = "player-200";
    message.player_name = "Ana";
    message.virtual_ip = "10.126.0.5";
    message.lobby_name = "friday-night";
    message.client_version = "1.2.0";
    return message;
}

} // namespace

TEST(WebSocketUrlTest, ParsesHostPortAndTarget) {
    auto url = WebSocketUrl::parse("ws://lobby.example.com:8445/signaling");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "lobby.example.com");
    EXPECT_EQ(url->port, "8445");
    EXPECT_EQ(url->target, "/signaling");

    auto bare = WebSocketUrl::parse("ws://127.0.0.1");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->port, "80");
    EXPECT_EQ(bare->target, "/");
}

TEST(WebSocketUrlTest, RejectsOtherForms) {
    EXPECT_FALSE(WebSocketUrl::parse("http://lobby.example.com/").has_value());
    EXPECT_FALSE(WebSocketUrl::parse("wss://lobby.example.com/").has_value());
    EXPECT_FALSE(WebSocketUrl::parse("ws://").has_value());
    EXPECT_FALSE(WebSocketUrl::parse("ws://:8445/x").has_value());
    EXPECT_FALSE(WebSocketUrl::parse("ws://host:/x").has_value());
}

TEST(WebSocketSignalingTest, RegistersAndLeavesOverRealSocket) {
    boost::asio::io_context io_context;
    LoopbackSignalingServer server(io_context);
    server.start();

    SignalingChannel channel(io_context, std::make_unique<WebSocketTransport>(io_context), core::SignalingOptions{});

    std::string lobby_id;
    channel.subscribe<RegisterSuccess>([&](const RegisterSuccess& message) {
        lobby_id = message.lobby_id;
        boost::asio::post(io_context, [&channel] { channel.disconnect(); });
    });

    core::Result connected(core::ErrorCode::INVALID_STATE);
    channel.connect(server.url(), [&](const core::Result& result) {
        connected = result;
        if (result) {
            EXPECT_TRUE(channel.register_client(registration()).success());
        }
    });

    io_context.run_for(std::chrono::seconds(5));

    EXPECT_TRUE(connected.success()) << connected.describe();
    EXPECT_EQ(lobby_id, "lobby-7");
    EXPECT_FALSE(channel.is_connected());

    ASSERT_GE(server.received.size(), 2u);
    auto first = SignalingCodec::decode(server.received[0]);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(std::holds_alternative<RegisterMessage>(*first));
    EXPECT_EQ(std::get<RegisterMessage>(*first).client_id, "player-200");

    auto last = SignalingCodec::decode(server.received[1]);
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(std::holds_alternative<LeaveMessage>(*last));
}

TEST(WebSocketSignalingTest, RefusedConnectionIsReported) {
    boost::asio::io_context io_context;

    // Grab a free port, then stop listening on it
    std::string url;
    {
        tcp::acceptor probe(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        url = "ws://127.0.0.1:" + std::to_string(probe.local_endpoint().port()) + "/signaling";
    }

    SignalingChannel channel(io_context, std::make_unique<WebSocketTransport>(io_context), core::SignalingOptions{});
    std::optional<core::Result> connected;
    channel.connect(url, [&connected](const core::Result& result) { connected = result; });

    io_context.run_for(std::chrono::seconds(5));

    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ(connected->error, core::ErrorCode::SIGNALING_UNAVAILABLE);
    EXPECT_FALSE(channel.is_connected());
}

TEST(WebSocketSignalingTest, InvalidUrlFailsWithoutNetwork) {
    boost::asio::io_context io_context;
    SignalingChannel channel(io_context, std::make_unique<WebSocketTransport>(io_context), core::SignalingOptions{});

    std::optional<core::Result> connected;
    channel.connect("http://lobby.test/", [&connected](const core::Result& result) { connected = result; });
    io_context.run();

    ASSERT_TRUE(connected.has_value());
    EXPECT_FALSE(connected->success());
}
