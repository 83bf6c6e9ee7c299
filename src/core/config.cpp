#include "routeweave/core/config.hpp"
#include "routeweave/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace routeweave::core {

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
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# RouteWeave Configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return true;
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

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
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

std::chrono::milliseconds Config::get_duration(const std::string& key,
                                               std::chrono::milliseconds default_value) const {
    auto value = get(key);
    if (!value || value->empty()) return default_value;
    return utils::StringUtils::parse_duration(*value);
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> result;
    auto value = get(key);
    if (!value) return result;
    
    for (const auto& item : utils::StringUtils::split(*value, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            result.push_back(trimmed);
        }
    }
    return result;
}

void Config::set_defaults() {
    values_["routing.composer"] = "parallel";
    values_["routing.routers"] = "local";
    values_["router.local.type"] = "memory";
    values_["router.local.timeout"] = "5s";
    values_["router.local.execute_after"] = "0ms";
    values_["router.local.ignore_error"] = "false";
    values_["node.peer_id"] = "local";
    values_["node.addresses"] = "";
    values_["request.timeout"] = "30s";
    values_["request.count"] = "0";
    values_["log.level"] = "info";
    values_["log.file"] = "routeweave.log";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

}
