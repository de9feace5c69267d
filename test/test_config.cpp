// LX Zap - Configuration Tests

#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include <zap/config.hpp>

using namespace zap;

TEST_CASE("Config from TOML", "[config]") {
    SECTION("Full file") {
        Config cfg = Config::from_toml(R"(
# zap deployment
[general]
log_level = "debug"

[contracts]
self = "0x000000000000000000000000000000000000d000"
owner = "0x000000000000000000000000000000000000D001"   # multisig
wrapped_native = "0x000000000000000000000000000000000000a000"
registry = "0x000000000000000000000000000000000000a002"
router = "0x000000000000000000000000000000000000a001"
)");

        REQUIRE(cfg.general.log_level == "debug");
        REQUIRE(cfg.contracts.self == make_address(0xD000));
        REQUIRE(cfg.contracts.owner == make_address(0xD001));
        REQUIRE(cfg.contracts.wrapped_native == make_address(0xA000));
        REQUIRE(cfg.contracts.registry == make_address(0xA002));
        REQUIRE(cfg.contracts.router == make_address(0xA001));
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Defaults when sections are missing") {
        Config cfg = Config::from_toml("");
        REQUIRE(cfg.general.log_level == "info");
        REQUIRE(is_zero(cfg.contracts.router));
    }

    SECTION("Unknown keys and sections are ignored") {
        Config cfg = Config::from_toml(R"(
[network]
rpc = "http://localhost:9650"
[general]
colour = true
)");
        REQUIRE(cfg.general.log_level == "info");
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(Config::from_toml("[contracts\nself = \"0x01\""), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_toml("[contracts]\nowner = \"0xnothex\""),
                          std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Config::from_file("/nonexistent/lxzap.toml"), std::runtime_error);
    }
}

TEST_CASE("Config validation", "[config]") {
    Config cfg;
    REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);

    cfg.with_self(make_address(1)).with_owner(make_address(2));
    REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);

    cfg.with_wrapped_native(make_address(3)).set_log_level("warn");
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.general.log_level == "warn");
    REQUIRE(is_zero(cfg.contracts.registry));
}

TEST_CASE("Configured contracts that differ from the bound ones", "[config]") {
    ContractsConfig bound;
    bound.self = make_address(1);
    bound.owner = make_address(2);
    bound.wrapped_native = make_address(0xA000);
    bound.registry = make_address(0xA002);
    bound.router = make_address(0xA001);

    SECTION("Unset keys are not reported") {
        Config cfg;
        cfg.with_self(make_address(1));
        REQUIRE(cfg.mismatched_contracts(bound).empty());
    }

    SECTION("Registry and router are reported like the wrapped native") {
        Config cfg = Config::from_toml(R"(
[contracts]
owner = "0x0000000000000000000000000000000000000002"
wrapped_native = "0x000000000000000000000000000000000000a000"
registry = "0x00000000000000000000000000000000000000f1"
router = "0x00000000000000000000000000000000000000f2"
)");
        const std::vector<std::string> expected{"registry", "router"};
        REQUIRE(cfg.mismatched_contracts(bound) == expected);
    }

    SECTION("Every key is compared") {
        Config cfg;
        cfg.with_self(make_address(9))
            .with_owner(make_address(9))
            .with_wrapped_native(make_address(9))
            .with_registry(make_address(9))
            .with_router(make_address(9));
        REQUIRE(cfg.mismatched_contracts(bound).size() == 5);
    }
}
