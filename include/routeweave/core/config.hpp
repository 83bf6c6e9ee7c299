#pragma once

#include <chrono>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace routeweave::core {

class Config {
public:
    Config() = default;
    
    static Config& instance();
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) return std::nullopt;
        return result;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    // Accepts "250ms", "5s", "2m", "1h" or a bare millisecond count.
    // Throws std::invalid_argument when the stored value is malformed.
    std::chrono::milliseconds get_duration(const std::string& key,
                                           std::chrono::milliseconds default_value = std::chrono::milliseconds{0}) const;
    
    // Comma separated, entries trimmed, empty entries dropped.
    std::vector<std::string> get_list(const std::string& key) const;
    
    void set_defaults();
    void clear() { values_.clear(); }
    
private:
    std::string trim(const std::string& str) const;
    
    std::map<std::string, std::string> values_;
};

}
