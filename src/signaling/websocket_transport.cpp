#include "lobbylink/signaling/websocket_transport.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"

namespace lobbylink::signaling {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

std::optional<WebSocketUrl> WebSocketUrl::parse(const std::string& url) {
    const std::string scheme = "ws://";
    if (!core::utils::StringUtils::starts_with(url, scheme)) {
        return std::nullopt;
    }

    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (authority.empty()) {
        return std::nullopt;
    }

    WebSocketUrl result;
    result.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        result.host = authority;
        result.port = "80";
    } else {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
        if (result.host.empty() || result.port.empty()) {
            return std::nullopt;
        }
    }
    return result;
}

class WebSocketTransport::Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::io_context& io_context, MessageHandler message_handler, CloseHandler close_handler)
        : resolver_(io_context)
        , ws_(io_context)
        , message_handler_(std::move(message_handler))
        , close_handler_(std::move(close_handler)) {}

    void start(WebSocketUrl url, OpenHandler handler) {
        url_ = std::move(url);
        open_handler_ = std::move(handler);

        resolver_.async_resolve(url_.host, url_.port,
            [self = shared_from_this()](const boost::system::error_code& ec,
                                        tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

    void send(std::string text) {
        if (!open_ || closing_) {
            LOG_WARN("Dropping signaling message, websocket is not open");
            return;
        }

        write_queue_.push(std::move(text));
        if (!write_in_progress_) {
            do_write();
        }
    }

    void close() {
        if (closing_ || finished_) {
            return;
        }
        closing_ = true;

        if (!open_) {
            resolver_.cancel();
            beast::get_lowest_layer(ws_).cancel();
            return;
        }

        ws_.async_close(websocket::close_code::normal,
            [self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec) {
                    LOG_DEBUG("Websocket close completed with: {}", ec.message());
                }
                beast::get_lowest_layer(self->ws_).close();
            });
    }

    void detach() {
        message_handler_ = nullptr;
        close_handler_ = nullptr;
        open_handler_ = nullptr;
    }

    bool is_open() const { return open_ && !closing_; }

private:
    void on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            finish(ec);
            return;
        }

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(ws_).async_connect(results,
            [self = shared_from_this()](const boost::system::error_code& ec, tcp::endpoint) {
                self->on_connect(ec);
            });
    }

    void on_connect(const boost::system::error_code& ec) {
        if (ec) {
            finish(ec);
            return;
        }

        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "lobbylink/1.2.0");
        }));

        ws_.async_handshake(url_.host + ":" + url_.port, url_.target,
            [self = shared_from_this()](const boost::system::error_code& ec) {
                self->on_handshake(ec);
            });
    }

    void on_handshake(const boost::system::error_code& ec) {
        if (ec) {
            finish(ec);
            return;
        }

        open_ = true;
        LOG_INFO("Websocket connected to {}:{}{}", url_.host, url_.port, url_.target);
        if (auto handler = std::move(open_handler_)) {
            open_handler_ = nullptr;
            handler({});
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_,
            [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    self->finish(ec);
                    return;
                }

                auto text = beast::buffers_to_string(self->buffer_.data());
                self->buffer_.consume(self->buffer_.size());
                if (self->message_handler_) {
                    self->message_handler_(text);
                }
                if (!self->finished_) {
                    self->do_read();
                }
            });
    }

    void do_write() {
        write_in_progress_ = true;
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(write_queue_.front()),
            [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
                self->write_queue_.pop();
                if (ec) {
                    self->write_in_progress_ = false;
                    self->finish(ec);
                    return;
                }
                if (!self->write_queue_.empty() && !self->finished_) {
                    self->do_write();
                } else {
                    self->write_in_progress_ = false;
                }
            });
    }

    void finish(const boost::system::error_code& ec) {
        if (finished_) {
            return;
        }
        finished_ = true;

        bool was_open = open_;
        open_ = false;

        if (ec && ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
            LOG_WARN("Websocket error: {}", ec.message());
        }

        if (!was_open) {
            if (auto handler = std::move(open_handler_)) {
                open_handler_ = nullptr;
                handler(ec ? ec : boost::system::error_code(boost::asio::error::operation_aborted));
            }
            return;
        }

        if (close_handler_) {
            auto handler = close_handler_;
            handler(ec);
        }
    }

    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    WebSocketUrl url_;

    OpenHandler open_handler_;
    MessageHandler message_handler_;
    CloseHandler close_handler_;

    std::queue<std::string> write_queue_;
    bool write_in_progress_ = false;
    bool open_ = false;
    bool closing_ = false;
    bool finished_ = false;
};

WebSocketTransport::WebSocketTransport(boost::asio::io_context& io_context)
    : io_context_(io_context) {}

WebSocketTransport::~WebSocketTransport() {
    if (session_) {
        session_->detach();
        session_->close();
    }
}

void WebSocketTransport::open(const std::string& url, OpenHandler handler) {
    auto parsed = WebSocketUrl::parse(url);
    if (!parsed) {
        LOG_ERROR("Invalid signaling URL: {}", url);
        boost::asio::post(io_context_, [handler = std::move(handler)] {
            handler(boost::asio::error::invalid_argument);
        });
        return;
    }

    if (session_) {
        session_->detach();
        session_->close();
    }

    session_ = std::make_shared<Session>(io_context_, message_handler_, close_handler_);
    session_->start(std::move(*parsed), std::move(handler));
}

void WebSocketTransport::send(std::string text) {
    if (session_) {
        session_->send(std::move(text));
    }
}

void WebSocketTransport::close() {
    if (session_) {
        session_->close();
    }
}

bool WebSocketTransport::is_open() const {
    return session_ && session_->is_open();
}

}
