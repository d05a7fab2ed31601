#pragma once

#include "lobbylink/transfer/transfer_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lobbylink::transfer {

constexpr std::uint32_t MAX_TRANSFER_THREADS = 12;

class RangePlanner {
public:
    // Thread count by size tier, never more threads than bytes.
    static std::uint32_t select_thread_count(std::uint64_t file_size);

    // Splits [0, file_size) into thread_count contiguous ranges; the first
    // file_size % thread_count ranges are one byte longer.
    static std::vector<ByteRange> partition(std::uint64_t file_size, std::uint32_t thread_count);

    static std::vector<ByteRange> plan(std::uint64_t file_size) {
        return partition(file_size, select_thread_count(file_size));
    }

    static std::uint32_t chunk_count(const ByteRange& range, std::size_t chunk_size);

    static std::string thread_request_id(const std::string& parent_id, std::uint32_t thread_index);

    // "<parent>-thread<N>" -> {parent, N}
    static std::optional<std::pair<std::string, std::uint32_t>> parse_thread_request_id(const std::string& id);
};

} // namespace lobbylink::transfer
