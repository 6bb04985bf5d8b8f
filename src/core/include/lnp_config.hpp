#ifndef LNP_CONFIG_HPP
#define LNP_CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lnp {

/**
 * @brief Runtime configuration for the presentation layer
 *
 * Flat "key = value" store. Keys used by the library:
 *
 *   log.level                      trace|debug|info|warn|error|fatal|none
 *   log.console                    bool
 *   log.file                       path, empty for none
 *   presentation.max_record_len    allocation guard for length prefixes
 *   presentation.enforce_even_odd  bool, default for DecodeOptions
 *
 * Thread-safe singleton; tests may construct private instances.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    Config() { loadDefaults(); }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(key) != 0;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::exception&) { return default_val; }
    }

    /// Unsigned value; negative, malformed or overflowing text yields default_val
    uint64_t getUInt64(const std::string& key, uint64_t default_val = 0) const {
        std::string v = get(key);
        if (v.empty() || v[0] == '-') return default_val;
        try {
            size_t used = 0;
            unsigned long long parsed = std::stoull(v, &used, 0);
            return used == v.size() ? static_cast<uint64_t>(parsed) : default_val;
        } catch (const std::exception&) {
            return default_val;
        }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        return default_val;
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    void setUInt64(const std::string& key, uint64_t value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) return false;
        std::ostringstream content;
        content << file.rdbuf();
        loadFromString(content.str());
        return true;
    }

    /// Parse "key = value" lines; '#' and ';' start comment lines
    void loadFromString(const std::string& text) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (!key.empty()) values_[key] = val;
        }
    }

    bool saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ofstream file(path);
        if (!file.is_open()) return false;

        file << "# LNP presentation layer configuration\n\n";
        for (const auto& [k, v] : values_) {
            file << k << " = " << v << "\n";
        }
        return true;
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["log.level"] = "info";
        values_["log.console"] = "true";
        values_["log.file"] = "";
        values_["presentation.max_record_len"] = "65535";
        values_["presentation.enforce_even_odd"] = "true";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    static void trim(std::string& s) {
        s.erase(0, s.find_first_not_of(" \t\r"));
        s.erase(s.find_last_not_of(" \t\r") + 1);
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief Apply log.level, log.console and log.file to Logger::instance()
 * @return false if log.file is set but could not be opened
 */
bool apply_logging_config(const Config& cfg = Config::instance());

} // namespace lnp

#endif // LNP_CONFIG_HPP
