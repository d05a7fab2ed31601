#include "lobbylink/transfer/chunk_assembler.hpp"
#include <fmt/format.h>

namespace lobbylink::transfer {

ChunkAssembler::ChunkAssembler(std::vector<ByteRange> ranges)
    : total_bytes_(0)
{
    threads_.reserve(ranges.size());
    for (const auto& range : ranges) {
        threads_.push_back(ThreadBuffer{range, {}, 0});
    }
}

std::uint64_t ChunkAssembler::add_chunk(std::uint32_t thread_index, std::uint32_t chunk_index,
                                        std::vector<std::uint8_t> data) {
    if (thread_index >= threads_.size()) {
        return 0;
    }

    auto& thread = threads_[thread_index];
    auto [it, inserted] = thread.chunks.try_emplace(chunk_index, std::move(data));
    if (!inserted) {
        return 0;
    }

    const auto added = static_cast<std::uint64_t>(it->second.size());
    thread.bytes += added;
    total_bytes_ += added;
    return added;
}

std::uint64_t ChunkAssembler::thread_bytes(std::uint32_t thread_index) const {
    return thread_index < threads_.size() ? threads_[thread_index].bytes : 0;
}

bool ChunkAssembler::thread_filled(std::uint32_t thread_index) const {
    return thread_index < threads_.size() && threads_[thread_index].bytes >= threads_[thread_index].range.size();
}

std::uint64_t ChunkAssembler::expected_bytes() const {
    std::uint64_t total = 0;
    for (const auto& thread : threads_) {
        total += thread.range.size();
    }
    return total;
}

core::Result ChunkAssembler::merge(std::vector<std::uint8_t>& output) const {
    output.clear();
    output.reserve(expected_bytes());

    for (std::size_t i = 0; i < threads_.size(); ++i) {
        const auto& thread = threads_[i];
        if (thread.bytes != thread.range.size()) {
            return core::Result(core::ErrorCode::THREAD_TRANSFER_FAILED,
                                fmt::format("Thread {} received {} of {} bytes", i, thread.bytes,
                                            thread.range.size()));
        }

        // std::map iterates in chunk index order
        for (const auto& [index, data] : thread.chunks) {
            output.insert(output.end(), data.begin(), data.end());
        }
    }
    return core::Result();
}

void ChunkAssembler::release() {
    for (auto& thread : threads_) {
        thread.chunks.clear();
        thread.bytes = 0;
    }
    total_bytes_ = 0;
}

} // namespace lobbylink::transfer
