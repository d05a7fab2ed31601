#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace lobbylink::transport {

// Binary frames on the file-transfer channel, all integers little-endian:
//   [type:u32][idLen:u32][id bytes][payload]
// chunk payload:    [chunkIndex:u32][totalChunks:u32][chunk bytes]
// complete payload: empty
// error payload:    UTF-8 message
enum class FrameType : std::uint32_t {
    CHUNK = 0,
    COMPLETE = 1,
    ERROR = 2
};

constexpr std::size_t FRAME_HEADER_SIZE = 8;
constexpr std::size_t CHUNK_HEADER_SIZE = 8;
constexpr std::size_t MAX_REQUEST_ID_LENGTH = 1024;

struct TransferFrame {
    FrameType type = FrameType::CHUNK;
    std::string request_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint8_t> payload;

    static TransferFrame chunk(std::string request_id, std::uint32_t chunk_index,
                               std::uint32_t total_chunks, std::vector<std::uint8_t> data);
    static TransferFrame complete(std::string request_id);
    static TransferFrame error(std::string request_id, const std::string& message);

    std::string error_message() const;

    std::vector<std::uint8_t> serialize() const;
    // Throws core::ProtocolError on truncated or unknown frames.
    static TransferFrame deserialize(std::span<const std::uint8_t> data);
};

}
