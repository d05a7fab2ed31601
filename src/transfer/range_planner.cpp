#include "lobbylink/transfer/range_planner.hpp"
#include <algorithm>
#include <charconv>

namespace lobbylink::transfer {

namespace {

constexpr std::uint64_t MIB = 1024 * 1024;
constexpr const char* THREAD_SUFFIX = "-thread";

}

std::uint32_t RangePlanner::select_thread_count(std::uint64_t file_size) {
    std::uint32_t threads;
    if (file_size < 1 * MIB) {
        threads = 2;
    } else if (file_size < 5 * MIB) {
        threads = 4;
    } else if (file_size < 20 * MIB) {
        threads = 8;
    } else if (file_size < 100 * MIB) {
        threads = 10;
    } else {
        threads = MAX_TRANSFER_THREADS;
    }

    if (file_size < threads) {
        threads = static_cast<std::uint32_t>(std::max<std::uint64_t>(file_size, 1));
    }
    return threads;
}

std::vector<ByteRange> RangePlanner::partition(std::uint64_t file_size, std::uint32_t thread_count) {
    std::vector<ByteRange> ranges;
    if (thread_count == 0) {
        return ranges;
    }

    const auto base = file_size / thread_count;
    const auto extra = file_size % thread_count;
    ranges.reserve(thread_count);

    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < thread_count; ++i) {
        auto length = base + (i < extra ? 1 : 0);
        ranges.push_back(ByteRange{offset, offset + length});
        offset += length;
    }
    return ranges;
}

std::uint32_t RangePlanner::chunk_count(const ByteRange& range, std::size_t chunk_size) {
    if (chunk_size == 0 || range.size() == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((range.size() + chunk_size - 1) / chunk_size);
}

std::string RangePlanner::thread_request_id(const std::string& parent_id, std::uint32_t thread_index) {
    return parent_id + THREAD_SUFFIX + std::to_string(thread_index);
}

std::optional<std::pair<std::string, std::uint32_t>> RangePlanner::parse_thread_request_id(const std::string& id) {
    auto pos = id.rfind(THREAD_SUFFIX);
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }

    const char* first = id.data() + pos + std::char_traits<char>::length(THREAD_SUFFIX);
    const char* last = id.data() + id.size();
    if (first == last) {
        return std::nullopt;
    }

    std::uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return std::make_pair(id.substr(0, pos), index);
}

} // namespace lobbylink::transfer
