#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "engine/audit.hpp"
#include "engine/config.hpp"
#include "engine/leg_intake.hpp"
#include "engine/parlay_architect.hpp"
#include "engine/serialize.hpp"
#include "utils/logger.hpp"

using namespace parlay;

namespace {

void print_usage() {
    std::cerr << "usage: parlay_cli --legs <csv> --profile <premium|balanced|speculative> --count <N>\n"
              << "                  [--config <yaml>] [--seed S] [--allow_same_entity]\n"
              << "                  [--include_category_x 0|1] [--audit <jsonl>] [--log_level debug|info|warn|error]\n";
}

std::optional<utils::LogLevel> parse_log_level(const std::string &s) {
    if (s == "debug") {
        return utils::LogLevel::Debug;
    }
    if (s == "info") {
        return utils::LogLevel::Info;
    }
    if (s == "warn") {
        return utils::LogLevel::Warn;
    }
    if (s == "error") {
        return utils::LogLevel::Error;
    }
    return std::nullopt;
}

}  // namespace

// Exit codes: 0 accepted, 2 rejected, 1 usage or load error.
int main(int argc, char **argv) {
    std::string config_path;
    std::string legs_path;
    std::string audit_path;
    engine::SelectionRequest request;
    bool have_count = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--legs" && i + 1 < argc) {
                legs_path = argv[++i];
            } else if (arg == "--profile" && i + 1 < argc) {
                request.risk_profile = argv[++i];
            } else if (arg == "--count" && i + 1 < argc) {
                request.legs = std::stoi(argv[++i]);
                have_count = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                request.seed = static_cast<uint64_t>(std::stoull(argv[++i]));
            } else if (arg == "--allow_same_entity") {
                request.allow_same_entity = true;
            } else if (arg == "--include_category_x" && i + 1 < argc) {
                request.include_category_x = std::stoi(argv[++i]) != 0;
            } else if (arg == "--audit" && i + 1 < argc) {
                audit_path = argv[++i];
            } else if (arg == "--log_level" && i + 1 < argc) {
                const auto level = parse_log_level(argv[++i]);
                if (!level) {
                    utils::error("unknown log level: " + std::string(argv[i]));
                    return 1;
                }
                utils::set_min_level(*level);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                utils::error("unknown or incomplete argument: " + arg);
                print_usage();
                return 1;
            }
        }
    } catch (const std::exception &e) {
        utils::error(std::string("bad numeric argument: ") + e.what());
        return 1;
    }

    if (legs_path.empty() || request.risk_profile.empty() || !have_count) {
        print_usage();
        return 1;
    }

    std::shared_ptr<const engine::EngineConfig> config;
    try {
        if (config_path.empty()) {
            utils::info("no --config given; using built-in defaults");
            config = std::make_shared<const engine::EngineConfig>(engine::EngineConfig::defaults());
        } else {
            config = std::make_shared<const engine::EngineConfig>(engine::load_engine_config(config_path));
        }
    } catch (const engine::ConfigError &e) {
        utils::error(std::string("configuration rejected: ") + e.what());
        return 1;
    }

    const auto pool = engine::load_legs_csv(legs_path);
    if (!pool) {
        return 1;
    }

    const engine::ParlayArchitect architect(config);
    const engine::SelectionResult result = architect.select(*pool, request);
    std::cout << engine::to_json(result) << std::endl;

    if (!audit_path.empty()) {
        engine::JsonlAuditSink sink(audit_path);
        if (!sink.is_open()) {
            return 1;
        }
        const engine::AuditRecord audit = engine::persist_attempt(sink, result, request, *config);
        sink.flush();
        if (sink.failed_writes() > 0) {
            utils::error("audit " + audit.attempt_id + " incomplete: " + std::to_string(sink.failed_writes()) +
                         " write(s) to " + audit_path + " failed");
            return 1;
        }
        utils::info("audit " + audit.attempt_id + " written to " + audit_path + " (gate health " +
                    engine::to_string(audit.gate_health.status) + ")");
    }
    return result.is_accepted() ? 0 : 2;
}
