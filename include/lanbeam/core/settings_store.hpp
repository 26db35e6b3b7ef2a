#pragma once

#include "lanbeam/core/result.hpp"
#include <filesystem>
#include <mutex>
#include <string>

namespace lanbeam::core {

struct Settings {
    std::string username;
    bool broadcasting_enabled = true;
    std::string broadcast_address = "255.255.255.255";

    // Host name (or "Unknown"), broadcasting on, "All" interfaces.
    static Settings defaults();

    bool operator==(const Settings&) const = default;
};

// Owns the node's user-visible settings. update() persists before the new
// values become visible; readers always see a complete, validated copy.
class SettingsStore {
public:
    explicit SettingsStore(std::filesystem::path settings_file);

    // Reads the settings file, falling back to defaults for missing or
    // invalid entries. A missing file is not an error.
    Result load();

    Settings get() const;

    // Full replace; the previous settings stay in force on failure.
    Result update(const Settings& settings);

    static Result validate(const Settings& settings);

    const std::filesystem::path& path() const { return settings_file_; }

private:
    Result persist(const Settings& settings) const;

    const std::filesystem::path settings_file_;

    mutable std::mutex mutex_;
    Settings settings_;

    // Serializes writers so file order matches in-memory order.
    std::mutex write_mutex_;
};

}
