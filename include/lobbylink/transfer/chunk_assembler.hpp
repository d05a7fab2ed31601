#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/transfer/transfer_types.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace lobbylink::transfer {

// Per-thread chunk buffers of one download. Chunks may arrive in any order;
// merge() rebuilds the file by chunk index within a thread and thread index across threads.
class ChunkAssembler {
public:
    explicit ChunkAssembler(std::vector<ByteRange> ranges);

    // Returns the number of new bytes stored, 0 for a duplicate or out-of-range thread.
    std::uint64_t add_chunk(std::uint32_t thread_index, std::uint32_t chunk_index,
                            std::vector<std::uint8_t> data);

    std::uint64_t thread_bytes(std::uint32_t thread_index) const;
    bool thread_filled(std::uint32_t thread_index) const;
    std::uint64_t total_bytes() const { return total_bytes_; }
    std::uint64_t expected_bytes() const;
    std::size_t thread_count() const { return threads_.size(); }

    core::Result merge(std::vector<std::uint8_t>& output) const;

    void release();

private:
    struct ThreadBuffer {
        ByteRange range;
        std::map<std::uint32_t, std::vector<std::uint8_t>> chunks;
        std::uint64_t bytes = 0;
    };

    std::vector<ThreadBuffer> threads_;
    std::uint64_t total_bytes_;
};

} // namespace lobbylink::transfer
