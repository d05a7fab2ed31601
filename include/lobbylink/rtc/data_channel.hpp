#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace lobbylink::rtc {

enum class ReadyState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

// A message channel carried by a peer connection. Implementations deliver
// every callback on the owning io_context.
class DataChannel {
public:
    using OpenHandler = std::function<void()>;
    using CloseHandler = std::function<void()>;
    using BinaryHandler = std::function<void(std::vector<std::uint8_t>)>;
    using TextHandler = std::function<void(std::string)>;
    using BufferedAmountLowHandler = std::function<void()>;

    virtual ~DataChannel() = default;

    virtual const std::string& label() const = 0;
    virtual ReadyState ready_state() const = 0;
    virtual std::size_t buffered_amount() const = 0;
    // Largest message send() accepts, as negotiated with the remote side
    virtual std::size_t max_message_size() const = 0;

    virtual bool send(std::span<const std::uint8_t> data) = 0;
    virtual bool send(const std::string& text) = 0;
    virtual void close() = 0;

    bool is_open() const { return ready_state() == ReadyState::OPEN; }

    void on_open(OpenHandler handler) { open_handler_ = std::move(handler); }
    void on_close(CloseHandler handler) { close_handler_ = std::move(handler); }
    void on_binary(BinaryHandler handler) { binary_handler_ = std::move(handler); }
    void on_text(TextHandler handler) { text_handler_ = std::move(handler); }
    // Fires when buffered_amount() drops to the channel's low threshold.
    void on_buffered_amount_low(BufferedAmountLowHandler handler) { buffered_low_handler_ = std::move(handler); }

protected:
    OpenHandler open_handler_;
    CloseHandler close_handler_;
    BinaryHandler binary_handler_;
    TextHandler text_handler_;
    BufferedAmountLowHandler buffered_low_handler_;
};

} // namespace lobbylink::rtc
