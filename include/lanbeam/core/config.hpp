#pragma once

#include <chrono>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace lanbeam::core {

// key=value configuration store. Lines starting with '#' are comments.
class Config {
public:
    Config() = default;

    // Process-wide instance used by the CLI to hold daemon options.
    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    void clear() { values_.clear(); }

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::chrono::milliseconds get_millis(const std::string& key, std::chrono::milliseconds default_value) const;

    const std::map<std::string, std::string>& values() const { return values_; }

    void set_defaults();

private:
    std::string trim(const std::string& str) const;

    std::map<std::string, std::string> values_;
};

}
