#include "lobbylink/transport/control_messages.hpp"
#include "lobbylink/core/error.hpp"
#include "lobbylink/core/json.hpp"

namespace lobbylink::transport {

namespace json = core::json;

std::string ControlCodec::encode(const ControlMessage& message) {
    Json::Value root;

    if (auto* m = std::get_if<FileTransferRequest>(&message)) {
        const auto& request = m->request;
        root["type"] = "file-transfer-request";
        root["requestId"] = request.request_id;
        root["parentRequestId"] = request.parent_request_id;
        root["shareId"] = request.share_id;
        root["ownerId"] = request.owner_id;
        root["requesterId"] = request.requester_id;
        root["filePath"] = request.file_path;
        root["fileName"] = request.file_name;
        root["fileSize"] = Json::UInt64(request.file_size);
        if (request.range) {
            root["rangeStart"] = Json::UInt64(request.range->start);
            root["rangeEnd"] = Json::UInt64(request.range->end);
        }
        if (request.thread_index) {
            root["threadId"] = *request.thread_index;
        }
    } else if (auto* m = std::get_if<FileTransferResponse>(&message)) {
        root["type"] = "file-transfer-response";
        root["requestId"] = m->request_id;
        root["accepted"] = m->accepted;
        if (!m->message.empty()) {
            root["message"] = m->message;
        }
    } else if (auto* m = std::get_if<FileTransferCancel>(&message)) {
        root["type"] = "file-transfer-cancel";
        root["requestId"] = m->request_id;
    }

    return json::write(root);
}

std::optional<ControlMessage> ControlCodec::decode(const std::string& text) {
    auto root = json::parse_object(text);
    auto type = json::require_string(root, "type");

    if (type == "file-transfer-request") {
        transfer::TransferRequest request;
        request.request_id = json::require_string(root, "requestId");
        request.parent_request_id = json::optional_string(root, "parentRequestId");
        request.share_id = json::require_string(root, "shareId");
        request.owner_id = json::optional_string(root, "ownerId");
        request.requester_id = json::optional_string(root, "requesterId");
        request.file_path = json::require_string(root, "filePath");
        request.file_name = json::optional_string(root, "fileName");

        auto file_size = json::require_int64(root, "fileSize");
        if (file_size < 0) {
            throw core::ProtocolError("Negative file size");
        }
        request.file_size = static_cast<std::uint64_t>(file_size);

        if (root.isMember("rangeStart") || root.isMember("rangeEnd")) {
            auto start = json::require_int64(root, "rangeStart");
            auto end = json::require_int64(root, "rangeEnd");
            if (start < 0 || end < start || static_cast<std::uint64_t>(end) > request.file_size) {
                throw core::ProtocolError("Invalid byte range");
            }
            request.range = transfer::ByteRange{static_cast<std::uint64_t>(start),
                                                static_cast<std::uint64_t>(end)};
        }
        if (root.isMember("threadId")) {
            auto thread = json::require_int64(root, "threadId");
            if (thread < 0) {
                throw core::ProtocolError("Negative thread id");
            }
            request.thread_index = static_cast<std::uint32_t>(thread);
        }
        return FileTransferRequest{std::move(request)};
    }
    if (type == "file-transfer-response") {
        return FileTransferResponse{json::require_string(root, "requestId"),
                                    json::require_bool(root, "accepted"),
                                    json::optional_string(root, "message")};
    }
    if (type == "file-transfer-cancel") {
        return FileTransferCancel{json::require_string(root, "requestId")};
    }

    return std::nullopt;
}

}
