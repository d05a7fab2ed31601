#pragma once

#include "lobbylink/transfer/transfer_types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace lobbylink::transport {

struct FileTransferRequest {
    transfer::TransferRequest request;
};

struct FileTransferResponse {
    std::string request_id;
    bool accepted = false;
    std::string message;
};

struct FileTransferCancel {
    std::string request_id;
};

using ControlMessage = std::variant<FileTransferRequest, FileTransferResponse, FileTransferCancel>;

// JSON codec for the ordered control channel.
class ControlCodec {
public:
    static std::string encode(const ControlMessage& message);
    // Throws core::ProtocolError on malformed input; std::nullopt for unknown types.
    static std::optional<ControlMessage> decode(const std::string& text);
};

}
