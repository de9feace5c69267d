// LX Zap CLI
//
// Quotes and dry-runs exact-output zaps against an in-memory chain built
// from a JSON scenario file.
//
//   lxzap [--config <file>] quote <scenario.json> <token> <amount> [deposit]
//   lxzap [--config <file>] simulate <scenario.json>

#include "zap/zap.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

constexpr zap::Address PROVIDER = zap::make_address(0xC000);
constexpr zap::Address DEFAULT_SELF = zap::make_address(0xD000);
constexpr zap::Address DEFAULT_OWNER = zap::make_address(0xD001);
constexpr zap::Address DEFAULT_USER = zap::make_address(0xE000);

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string command;
    std::vector<std::string> args;
};

void print_usage() {
    std::cerr << "Usage:\n"
              << "  lxzap [--config <file>] quote <scenario.json> <token> <amount> [deposit]\n"
              << "  lxzap [--config <file>] simulate <scenario.json>\n";
}

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

json load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }
    return json::parse(file);
}

zap::Amount amount_field(const json& j, const char* key, zap::Amount fallback = 0) {
    if (!j.contains(key)) return fallback;
    const json& v = j.at(key);
    if (v.is_string()) return zap::parse_amount(v.get<std::string>());
    return static_cast<zap::Amount>(v.get<uint64_t>());
}

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

// tokens: [{ "symbol", "address", "pool": { "token_reserve", "base_reserve" } }]
void build_chain(zap::sim::Chain& chain, const json& scenario) {
    if (scenario.contains("now")) {
        chain.set_now(scenario.at("now").get<uint64_t>());
    }

    for (const auto& t : scenario.at("tokens")) {
        zap::Address addr = zap::parse_address(t.at("address").get<std::string>());
        zap::sim::Token& token = chain.create_token(addr, t.value("symbol", "TKN"));

        if (!t.contains("pool")) continue;
        const json& pool = t.at("pool");
        zap::Amount token_reserve = amount_field(pool, "token_reserve");
        zap::Amount base_reserve = amount_field(pool, "base_reserve");

        token.mint(PROVIDER, token_reserve);
        chain.bank().mint(PROVIDER, base_reserve);
        chain.create_pool(token, token_reserve, base_reserve, PROVIDER);
        spdlog::debug("pool {} seeded with {} / {}", token.symbol(),
                      zap::to_string(token_reserve), zap::to_string(base_reserve));
    }
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int run_quote(const zap::Config& config, const Options& opts) {
    if (opts.args.size() < 3) {
        print_usage();
        return 1;
    }

    zap::sim::Chain chain;
    build_chain(chain, load_json(opts.args[0]));

    zap::EventLog events;
    zap::LiquidityOrchestrator orchestrator(
        config.contracts.self, config.contracts.owner,
        zap::ZapDeps{chain.registry(), chain.wrapped(), chain.router(),
                     chain.assets(), chain.bank(), events});

    zap::AssetId token = zap::parse_address(opts.args[1]);
    zap::Amount amount = zap::parse_amount(opts.args[2]);

    json out;
    out["token"] = zap::to_hex(token);
    out["desired_output"] = zap::to_string(amount);
    out["pair_exists"] = orchestrator.pair_exists(token);
    out["required_input"] = zap::to_string(orchestrator.quote_required_input(amount, token));
    if (opts.args.size() > 3) {
        zap::Amount deposit = zap::parse_amount(opts.args[3]);
        out["total_funds_needed"] =
            zap::to_string(orchestrator.quote_total_funds_needed(amount, token, deposit));
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

// zap: { "token", "desired_output", "deposit", "value"?, "min_token"?,
//        "min_base"?, "deadline"? }
int run_simulate(const zap::Config& config, const Options& opts) {
    if (opts.args.empty()) {
        print_usage();
        return 1;
    }

    json scenario = load_json(opts.args[0]);
    zap::sim::Chain chain;
    build_chain(chain, scenario);

    zap::EventLog events;
    zap::LiquidityOrchestrator orchestrator(
        config.contracts.self, config.contracts.owner,
        zap::ZapDeps{chain.registry(), chain.wrapped(), chain.router(),
                     chain.assets(), chain.bank(), events});

    const json& z = scenario.at("zap");
    zap::ZapRequest req{};
    req.output_asset = zap::parse_address(z.at("token").get<std::string>());
    req.desired_output = amount_field(z, "desired_output");
    req.secondary_deposit = amount_field(z, "deposit");
    req.min_token_deposit = amount_field(z, "min_token");
    req.min_base_deposit = amount_field(z, "min_base");
    req.deadline = z.value("deadline", chain.now() + 600);

    zap::Amount value = amount_field(
        z, "value", orchestrator.quote_total_funds_needed(req.desired_output, req.output_asset,
                                                          req.secondary_deposit));
    chain.bank().mint(DEFAULT_USER, value);

    zap::SettlementResult result = chain.atomically([&] {
        zap::CallContext ctx = chain.pay(DEFAULT_USER, orchestrator.address(), value);
        return orchestrator.swap_and_add_liquidity(ctx, req);
    });

    json out;
    out["settlement"] = result;
    out["events"]["swaps"] = events.swaps();
    out["events"]["deposits"] = events.deposits();
    out["caller_native_refund"] = zap::to_string(chain.bank().balance_of(DEFAULT_USER));
    std::cout << out.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    Options opts = parse_args(argc, argv);
    if (opts.command.empty()) {
        print_usage();
        return 1;
    }

    try {
        zap::Config config;
        if (!opts.config_path.empty()) {
            config = zap::Config::from_file(opts.config_path);
        }
        if (zap::is_zero(config.contracts.self)) config.with_self(DEFAULT_SELF);
        if (zap::is_zero(config.contracts.owner)) config.with_owner(DEFAULT_OWNER);
        if (zap::is_zero(config.contracts.wrapped_native)) {
            config.with_wrapped_native(zap::sim::Chain::WRAPPED_ADDRESS);
        }
        config.validate();
        zap::setup_logging(config.general.log_level);

        // The simulated chain deploys its own collaborators
        zap::ContractsConfig simulated = config.contracts;
        simulated.wrapped_native = zap::sim::Chain::WRAPPED_ADDRESS;
        simulated.registry = zap::sim::Chain::REGISTRY_ADDRESS;
        simulated.router = zap::sim::Chain::ROUTER_ADDRESS;
        for (const std::string& key : config.mismatched_contracts(simulated)) {
            spdlog::warn("simulated chain ignores contracts.{}", key);
        }

        if (opts.command == "quote") return run_quote(config, opts);
        if (opts.command == "simulate") return run_simulate(config, opts);

        print_usage();
        return 1;
    } catch (const zap::Error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
