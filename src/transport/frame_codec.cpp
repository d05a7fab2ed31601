#include "lobbylink/transport/frame_codec.hpp"
#include "lobbylink/core/error.hpp"

namespace lobbylink::transport {

namespace {
    void write_uint32_le(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back(value & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 24) & 0xFF);
    }

    std::uint32_t read_uint32_le(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw core::ProtocolError("Insufficient data for uint32");
        std::uint32_t value = static_cast<std::uint32_t>(data[0]) |
                              (static_cast<std::uint32_t>(data[1]) << 8) |
                              (static_cast<std::uint32_t>(data[2]) << 16) |
                              (static_cast<std::uint32_t>(data[3]) << 24);
        data = data.subspan(4);
        return value;
    }
}

TransferFrame TransferFrame::chunk(std::string request_id, std::uint32_t chunk_index,
                                   std::uint32_t total_chunks, std::vector<std::uint8_t> data) {
    TransferFrame frame;
    frame.type = FrameType::CHUNK;
    frame.request_id = std::move(request_id);
    frame.chunk_index = chunk_index;
    frame.total_chunks = total_chunks;
    frame.payload = std::move(data);
    return frame;
}

TransferFrame TransferFrame::complete(std::string request_id) {
    TransferFrame frame;
    frame.type = FrameType::COMPLETE;
    frame.request_id = std::move(request_id);
    return frame;
}

TransferFrame TransferFrame::error(std::string request_id, const std::string& message) {
    TransferFrame frame;
    frame.type = FrameType::ERROR;
    frame.request_id = std::move(request_id);
    frame.payload.assign(message.begin(), message.end());
    return frame;
}

std::string TransferFrame::error_message() const {
    return std::string(payload.begin(), payload.end());
}

std::vector<std::uint8_t> TransferFrame::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(FRAME_HEADER_SIZE + request_id.size() + CHUNK_HEADER_SIZE + payload.size());

    write_uint32_le(buffer, static_cast<std::uint32_t>(type));
    write_uint32_le(buffer, static_cast<std::uint32_t>(request_id.size()));
    buffer.insert(buffer.end(), request_id.begin(), request_id.end());

    if (type == FrameType::CHUNK) {
        write_uint32_le(buffer, chunk_index);
        write_uint32_le(buffer, total_chunks);
    }
    buffer.insert(buffer.end(), payload.begin(), payload.end());

    return buffer;
}

TransferFrame TransferFrame::deserialize(std::span<const std::uint8_t> data) {
    TransferFrame frame;

    auto type = read_uint32_le(data);
    if (type > static_cast<std::uint32_t>(FrameType::ERROR)) {
        throw core::ProtocolError("Unknown frame type " + std::to_string(type));
    }
    frame.type = static_cast<FrameType>(type);

    auto id_length = read_uint32_le(data);
    if (id_length > MAX_REQUEST_ID_LENGTH || data.size() < id_length) {
        throw core::ProtocolError("Invalid request id length");
    }
    frame.request_id.assign(data.begin(), data.begin() + id_length);
    data = data.subspan(id_length);

    if (frame.type == FrameType::CHUNK) {
        frame.chunk_index = read_uint32_le(data);
        frame.total_chunks = read_uint32_le(data);
        if (frame.chunk_index >= frame.total_chunks) {
            throw core::ProtocolError("Chunk index out of range");
        }
    }

    frame.payload.assign(data.begin(), data.end());
    return frame;
}

}
