#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lobbylink::transfer {

enum class TransferStatus {
    PENDING,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(TransferStatus status);
bool is_terminal(TransferStatus status);

// Half-open byte range [start, end).
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    std::uint64_t size() const { return end - start; }
    bool operator==(const ByteRange& other) const = default;
};

// A file offered by a remote share, as the requester knows it.
struct FileDescriptor {
    std::string share_id;
    std::string owner_id;
    std::string file_path;    // relative to the share root
    std::string file_name;
    std::uint64_t file_size = 0;
};

struct TransferRequest {
    std::string request_id;
    std::string parent_request_id;
    std::string share_id;
    std::string owner_id;
    std::string requester_id;
    std::string file_path;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::optional<ByteRange> range;
    std::optional<std::uint32_t> thread_index;
};

struct TransferProgress {
    std::string request_id;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t transferred = 0;
    double percent = 0.0;
    double speed = 0.0;   // bytes per second
    TransferStatus status = TransferStatus::PENDING;
    std::optional<std::string> error;
};

}
