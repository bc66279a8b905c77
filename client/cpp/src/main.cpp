// Aequi CLI
// Copyright (c) 2026 The Aequi Authors
// SPDX-License-Identifier: MIT
//
// Inspects an executor configuration: prints the registry it deploys with,
// dry-runs injection validation for a payload and decodes execute() calldata.

#include <aequi/aequi.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace aequi;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// JSON rendering
//------------------------------------------------------------------------------

json registry_to_json(const Registry& registry, const ExecutorConfig& config) {
    json out;
    out["owner"] = hex::encode(registry.owner());

    json targets = json::array();
    for (const auto& target : registry.targets()) {
        targets.push_back(hex::encode(target));
    }
    out["targets"] = targets;

    json offsets = json::object();
    for (const auto& [selector, offset] : registry.selector_offsets()) {
        offsets[hex::encode_selector(selector)] = offset;
    }
    out["selector_offsets"] = offsets;

    out["limits"] = {
        {"max_pulls", config.limits.max_pulls},
        {"max_approvals", config.limits.max_approvals},
        {"max_calls", config.limits.max_calls},
        {"max_flush_tokens", config.limits.max_flush_tokens},
        {"max_admin_batch", registry.max_admin_batch()},
    };
    return out;
}

json batch_to_json(const Batch& batch) {
    json out;
    out["pulls"] = json::array();
    for (const auto& pull : batch.pulls) {
        out["pulls"].push_back({{"token", hex::encode(pull.token)}, {"amount", to_string(pull.amount)}});
    }
    out["approvals"] = json::array();
    for (const auto& approval : batch.approvals) {
        out["approvals"].push_back({
            {"token", hex::encode(approval.token)},
            {"spender", hex::encode(approval.spender)},
            {"amount", to_string(approval.amount)},
            {"revoke_after", approval.revoke_after},
        });
    }
    out["calls"] = json::array();
    for (const auto& call : batch.calls) {
        out["calls"].push_back({
            {"target", hex::encode(call.target)},
            {"value", to_string(call.value)},
            {"payload", hex::encode(call.payload)},
            {"inject_token", hex::encode(call.inject_token)},
            {"inject_offset", call.inject_offset},
        });
    }
    out["tokens_to_flush"] = json::array();
    for (const auto& token : batch.tokens_to_flush) {
        out["tokens_to_flush"].push_back(hex::encode(token));
    }
    return out;
}

json error_to_json(const ExecutorError& e) {
    return {{"valid", false}, {"error", e.what()}, {"revert_data", hex::encode(e.revert_data())}};
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int run_command(const ExecutorConfig& config, const std::vector<std::string>& args) {
    std::string cmd = args[0];
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (cmd == "show") {
        auto registry = config.make_registry();
        std::cout << registry_to_json(*registry, config).dump(2) << "\n";
        return 0;
    }

    if (cmd == "check") {
        if (args.size() < 3) {
            std::cerr << "Usage: aequi-cli check <payload-hex> <offset>\n";
            return 1;
        }
        auto registry = config.make_registry();
        Bytes payload = hex::decode(args[1]);
        uint64_t offset = std::stoull(args[2]);
        try {
            Selector selector = validate_injection(*registry, payload, offset);
            json out = {{"valid", true}, {"selector", hex::encode_selector(selector)}, {"offset", offset}};
            std::cout << out.dump(2) << "\n";
            return 0;
        } catch (const ExecutorError& e) {
            std::cout << error_to_json(e).dump(2) << "\n";
            return 1;
        }
    }

    if (cmd == "decode") {
        if (args.size() < 2) {
            std::cerr << "Usage: aequi-cli decode <calldata-hex>\n";
            return 1;
        }
        Batch batch = decode_execute(hex::decode(args[1]));
        std::cout << batch_to_json(batch).dump(2) << "\n";
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return 1;
}

void print_usage(const char* prog) {
    std::cout << "Aequi CLI " << VERSION << "\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <path>  Executor configuration (JSON)\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  show                         Print owner, whitelist, selector offsets and limits\n"
              << "  check <payload-hex> <offset> Validate an injection against the selector table\n"
              << "  decode <calldata-hex>        Decode execute() calldata\n\n"
              << "Examples:\n"
              << "  " << prog << " -c aequi.json show\n"
              << "  " << prog << " -c aequi.json check 0x38ed1739... 4\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);
    if (options.command_args.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (options.config_path.empty()) {
        std::cerr << "No configuration given. Use -c <path>.\n";
        return 1;
    }

    try {
        ExecutorConfig config = ExecutorConfig::from_file(options.config_path);
        if (options.verbose) {
            config.set_log_level("debug");
        }
        config.apply_log_level();
        return run_command(config, options.command_args);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
