#include "lanbeam/core/settings_store.hpp"
#include "lanbeam/core/config.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"
#include "lanbeam/network/interfaces.hpp"
#include <system_error>

namespace lanbeam::core {

namespace {
constexpr const char* KEY_USERNAME = "username";
constexpr const char* KEY_BROADCASTING = "broadcasting_enabled";
constexpr const char* KEY_BROADCAST_ADDRESS = "broadcast_address";
}

Settings Settings::defaults() {
    Settings settings;
    settings.username = utils::SystemUtils::hostname();
    if (settings.username.empty()) {
        settings.username = "Unknown";
    }
    settings.broadcasting_enabled = true;
    settings.broadcast_address = network::ALL_INTERFACES_BROADCAST;
    return settings;
}

SettingsStore::SettingsStore(std::filesystem::path settings_file)
    : settings_file_(std::move(settings_file))
    , settings_(Settings::defaults()) {
}

Result SettingsStore::load() {
    auto loaded = Settings::defaults();

    Config file;
    if (!file.load_from_file(settings_file_.string())) {
        LOG_INFO("No settings file at {}, using defaults", settings_file_.string());
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = loaded;
        return Result();
    }

    auto username = utils::StringUtils::trim(file.get_string(KEY_USERNAME));
    if (!username.empty()) {
        loaded.username = username;
    }
    loaded.broadcasting_enabled = file.get_bool(KEY_BROADCASTING, loaded.broadcasting_enabled);

    auto address = file.get_string(KEY_BROADCAST_ADDRESS, loaded.broadcast_address);
    if (network::is_valid_ipv4(address)) {
        loaded.broadcast_address = address;
    } else {
        LOG_WARN("Ignoring invalid broadcast address '{}' in {}", address, settings_file_.string());
    }

    LOG_INFO("Loaded settings from {} (username='{}', broadcasting={}, address={})",
             settings_file_.string(), loaded.username, loaded.broadcasting_enabled,
             loaded.broadcast_address);

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = loaded;
    return Result();
}

Settings SettingsStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

Result SettingsStore::update(const Settings& requested) {
    // Stored the way load() reads it back.
    auto settings = requested;
    settings.username = utils::StringUtils::trim(settings.username);

    auto valid = validate(settings);
    if (!valid) {
        return valid;
    }

    std::lock_guard<std::mutex> write_lock(write_mutex_);

    auto persisted = persist(settings);
    if (!persisted) {
        LOG_ERROR("Failed to persist settings: {}", persisted.describe());
        return persisted;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = settings;
    }

    LOG_INFO("Settings updated (username='{}', broadcasting={}, address={})",
             settings.username, settings.broadcasting_enabled, settings.broadcast_address);
    return Result();
}

Result SettingsStore::validate(const Settings& settings) {
    if (utils::StringUtils::trim(settings.username).empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Username must not be empty");
    }
    if (settings.username.find('\n') != std::string::npos ||
        settings.username.find('\r') != std::string::npos) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Username must be a single line");
    }
    if (!network::is_valid_ipv4(settings.broadcast_address)) {
        return Result(ErrorCode::INVALID_ARGUMENT,
                      "Invalid broadcast address: " + settings.broadcast_address);
    }
    return Result();
}

Result SettingsStore::persist(const Settings& settings) const {
    auto parent = settings_file_.parent_path();
    if (!parent.empty() && !utils::FileUtils::create_directories(parent)) {
        return Result(ErrorCode::PERSISTENCE_FAILED,
                      "Cannot create directory " + parent.string());
    }

    Config file;
    file.set(KEY_USERNAME, settings.username);
    file.set(KEY_BROADCASTING, settings.broadcasting_enabled ? "true" : "false");
    file.set(KEY_BROADCAST_ADDRESS, settings.broadcast_address);

    auto temp_path = settings_file_;
    temp_path += ".tmp";

    if (!file.save_to_file(temp_path.string())) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return Result(ErrorCode::PERSISTENCE_FAILED, "Cannot write " + temp_path.string());
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, settings_file_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return Result(ErrorCode::PERSISTENCE_FAILED,
                      "Cannot replace " + settings_file_.string() + ": " + ec.message());
    }

    return Result();
}

}
