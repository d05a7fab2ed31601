#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/core/options.hpp"
#include "lobbylink/signaling/signaling_messages.hpp"
#include "lobbylink/signaling/signaling_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lobbylink::signaling {

// Persistent, server-relayed control connection. Inbound messages are decoded
// into SignalingMessage and dispatched to typed subscribers. Unexpected closes
// are retried with exponential backoff unless the close was requested locally.
class SignalingChannel {
public:
    using ResultHandler = std::function<void(const core::Result&)>;

    SignalingChannel(boost::asio::io_context& io_context,
                     std::unique_ptr<SignalingTransport> transport,
                     const core::SignalingOptions& options);
    ~SignalingChannel();

    SignalingChannel(const SignalingChannel&) = delete;
    SignalingChannel& operator=(const SignalingChannel&) = delete;

    // Handler runs once the transport acknowledges the connection.
    void connect(const std::string& url, ResultHandler handler);

    // Remembered so a reconnect can register again.
    core::Result register_client(const RegisterMessage& registration);

    core::Result send(const SignalingMessage& message);

    // Sets the intentional-disconnect flag before tearing down.
    void disconnect();

    template<typename T>
    void subscribe(std::function<void(const T&)> handler) {
        const auto index = SignalingMessage(std::in_place_type<T>).index();
        handlers_[index].push_back(
            [handler = std::move(handler)](const SignalingMessage& message) {
                handler(std::get<T>(message));
            });
    }

    // Terminal connection problems: exhausted reconnects, version rejection.
    void set_error_handler(ResultHandler handler) { error_handler_ = std::move(handler); }

    bool is_connected() const { return connected_; }
    bool is_intentional_disconnect() const { return intentional_disconnect_; }
    int reconnect_attempts() const { return reconnect_attempts_; }

    static std::chrono::milliseconds backoff_delay(int attempt, const core::SignalingOptions& options);

private:
    void handle_text(const std::string& text);
    void dispatch(const SignalingMessage& message);
    void handle_close(const boost::system::error_code& ec);
    void schedule_reconnect();
    void attempt_reconnect();
    void report_error(const core::Result& result);

    std::unique_ptr<SignalingTransport> transport_;
    core::SignalingOptions options_;
    boost::asio::steady_timer reconnect_timer_;

    std::string url_;
    std::optional<RegisterMessage> registration_;
    bool connected_;
    bool intentional_disconnect_;
    int reconnect_attempts_;

    std::unordered_map<std::size_t, std::vector<std::function<void(const SignalingMessage&)>>> handlers_;
    ResultHandler error_handler_;
};

}
