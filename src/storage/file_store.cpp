#include "lobbylink/storage/file_store.hpp"
#include "lobbylink/core/logger.hpp"
#include <fstream>

namespace lobbylink::storage {

core::Result LocalFileStore::file_size(const std::filesystem::path& path, std::uint64_t& size) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Not a regular file: " + path.string());
    }

    size = std::filesystem::file_size(path, ec);
    if (ec) {
        return core::Result(core::ErrorCode::FILE_IO, ec.message());
    }
    return core::Result();
}

core::Result LocalFileStore::read_range(const std::filesystem::path& path, std::uint64_t offset,
                                        std::uint64_t length, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return core::Result(core::ErrorCode::FILE_IO, "Cannot open " + path.string());
    }

    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        return core::Result(core::ErrorCode::FILE_IO, "Seek failed in " + path.string());
    }

    data.resize(length);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(file.gcount()) != length) {
        data.resize(static_cast<std::size_t>(file.gcount()));
        return core::Result(core::ErrorCode::FILE_IO,
                            "Short read from " + path.string() + " at offset " + std::to_string(offset));
    }
    return core::Result();
}

core::Result LocalFileStore::write_file(const std::filesystem::path& path,
                                        std::span<const std::uint8_t> data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return core::Result(core::ErrorCode::FILE_IO, "Cannot create directory: " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return core::Result(core::ErrorCode::FILE_IO, "Cannot open " + path.string() + " for writing");
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return core::Result(core::ErrorCode::FILE_IO, "Write failed for " + path.string());
    }

    LOG_DEBUG("Wrote {} bytes to {}", data.size(), path.string());
    return core::Result();
}

} // namespace lobbylink::storage
