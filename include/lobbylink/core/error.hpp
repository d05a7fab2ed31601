#pragma once

#include <stdexcept>
#include <string>

namespace lobbylink::core {

enum class ErrorCode {
    SUCCESS = 0,
    SIGNALING_REJECTED,      // registration refused, connection stays open
    VERSION_TOO_OLD,         // fatal, reconnection stops
    SIGNALING_UNAVAILABLE,
    NEGOTIATION_FAILED,
    CHANNEL_UNAVAILABLE,
    THREAD_TRANSFER_FAILED,
    FILE_IO,
    INVALID_MESSAGE,
    INVALID_STATE,
    NOT_FOUND,
    CANCELLED
};

const char* to_string(ErrorCode error);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    std::string describe() const;
};

// Thrown by wire decoders on malformed input.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

}
