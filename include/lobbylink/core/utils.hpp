#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lobbylink::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string random_base36(std::size_t length);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

class TimeUtils {
public:
    static std::int64_t unix_millis();
    static std::int64_t unix_seconds();
    static std::string format_timestamp(std::int64_t unix_millis);
};

}
