#include "lanbeam/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace lanbeam::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file << "# LanBeam configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    file.flush();
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::chrono::milliseconds Config::get_millis(const std::string& key, std::chrono::milliseconds default_value) const {
    auto value = get_as<long long>(key);
    if (!value || *value < 0) {
        return default_value;
    }
    return std::chrono::milliseconds(*value);
}

void Config::set_defaults() {
    values_["discovery.port"] = "53317";
    values_["discovery.announce_interval_ms"] = "1000";
    values_["discovery.peer_expiry_ms"] = "3000";
    values_["transfer.port"] = "53318";
    values_["transfer.chunk_size"] = "65536";
    values_["transfer.stall_timeout_ms"] = "15000";
    values_["transfer.progress_interval_ms"] = "100";
    values_["offer.proposal_timeout_ms"] = "60000";
    values_["offer.connect_timeout_ms"] = "3000";
    values_["offer.handshake_timeout_ms"] = "10000";
    values_["storage.download_dir"] = "~/Downloads";
    values_["storage.settings_file"] = "~/.lanbeam/settings.conf";
    values_["ipc.socket"] = "/tmp/lanbeam.sock";
    values_["log.level"] = "info";
    values_["log.file"] = "lanbeam.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == str.end()) {
        return "";
    }

    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

}
