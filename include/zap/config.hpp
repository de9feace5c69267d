// LX Zap - Configuration
// Contract addresses the zap is bound to, plus logging

#ifndef ZAP_CONFIG_HPP
#define ZAP_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace zap {

// General settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Addresses of the zap itself and its collaborators
struct ContractsConfig {
    Address self{};
    Address owner{};
    Address wrapped_native{};
    Address registry{};
    Address router{};
};

class Config {
public:
    GeneralConfig general;
    ContractsConfig contracts;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Throws std::invalid_argument if a required address is zero
    void validate() const;

    // Keys under [contracts] that are set but differ from `bound`
    std::vector<std::string> mismatched_contracts(const ContractsConfig& bound) const;

    // Builder methods
    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_self(const Address& addr) {
        contracts.self = addr;
        return *this;
    }

    Config& with_owner(const Address& addr) {
        contracts.owner = addr;
        return *this;
    }

    Config& with_wrapped_native(const Address& addr) {
        contracts.wrapped_native = addr;
        return *this;
    }

    Config& with_registry(const Address& addr) {
        contracts.registry = addr;
        return *this;
    }

    Config& with_router(const Address& addr) {
        contracts.router = addr;
        return *this;
    }
};

}  // namespace zap

#endif // ZAP_CONFIG_HPP
