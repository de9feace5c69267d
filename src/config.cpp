// LX Zap - Configuration Implementation

#include "zap/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace zap {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drops a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw std::runtime_error("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
        }
        else if (current_section == "contracts") {
            if (key == "self") config.contracts.self = parse_address(value);
            else if (key == "owner") config.contracts.owner = parse_address(value);
            else if (key == "wrapped_native") config.contracts.wrapped_native = parse_address(value);
            else if (key == "registry") config.contracts.registry = parse_address(value);
            else if (key == "router") config.contracts.router = parse_address(value);
        }
    }

    return config;
}

void Config::validate() const {
    if (is_zero(contracts.self)) {
        throw std::invalid_argument("contracts.self must be set");
    }
    if (is_zero(contracts.owner)) {
        throw std::invalid_argument("contracts.owner must be set");
    }
    if (is_zero(contracts.wrapped_native)) {
        throw std::invalid_argument("contracts.wrapped_native must be set");
    }
}

std::vector<std::string> Config::mismatched_contracts(const ContractsConfig& bound) const {
    std::vector<std::string> keys;
    auto check = [&](const char* key, const Address& configured, const Address& actual) {
        if (!is_zero(configured) && configured != actual) keys.emplace_back(key);
    };
    check("self", contracts.self, bound.self);
    check("owner", contracts.owner, bound.owner);
    check("wrapped_native", contracts.wrapped_native, bound.wrapped_native);
    check("registry", contracts.registry, bound.registry);
    check("router", contracts.router, bound.router);
    return keys;
}

}  // namespace zap
