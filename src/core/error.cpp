#include "lobbylink/core/error.hpp"

namespace lobbylink::core {

const char* to_string(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::SIGNALING_REJECTED: return "signaling rejected";
        case ErrorCode::VERSION_TOO_OLD: return "version too old";
        case ErrorCode::SIGNALING_UNAVAILABLE: return "signaling unavailable";
        case ErrorCode::NEGOTIATION_FAILED: return "negotiation failed";
        case ErrorCode::CHANNEL_UNAVAILABLE: return "channel unavailable";
        case ErrorCode::THREAD_TRANSFER_FAILED: return "thread transfer failed";
        case ErrorCode::FILE_IO: return "file i/o error";
        case ErrorCode::INVALID_MESSAGE: return "invalid message";
        case ErrorCode::INVALID_STATE: return "invalid state";
        case ErrorCode::NOT_FOUND: return "not found";
        case ErrorCode::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}
