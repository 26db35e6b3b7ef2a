#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string to_hex(const std::uint8_t* data, std::size_t size);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool is_readable(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();

    // Expands a leading "~/" to the home directory.
    static std::filesystem::path expand_user(const std::string& path);

    // Reduces a name received from a peer to a bare file name; returns
    // nullopt for names that cannot be stored ("", ".", "..").
    static std::optional<std::string> sanitize_file_name(const std::string& name);
};

class SystemUtils {
public:
    static std::string hostname();
};

}
