#pragma once

#include "lobbylink/core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace lobbylink::storage {

// Byte-oriented file access addressed by path.
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual core::Result file_size(const std::filesystem::path& path, std::uint64_t& size) = 0;
    virtual core::Result read_range(const std::filesystem::path& path, std::uint64_t offset,
                                    std::uint64_t length, std::vector<std::uint8_t>& data) = 0;
    virtual core::Result write_file(const std::filesystem::path& path,
                                    std::span<const std::uint8_t> data) = 0;
};

class LocalFileStore : public FileStore {
public:
    core::Result file_size(const std::filesystem::path& path, std::uint64_t& size) override;
    core::Result read_range(const std::filesystem::path& path, std::uint64_t offset,
                            std::uint64_t length, std::vector<std::uint8_t>& data) override;
    // Creates missing parent directories.
    core::Result write_file(const std::filesystem::path& path,
                            std::span<const std::uint8_t> data) override;
};

} // namespace lobbylink::storage
