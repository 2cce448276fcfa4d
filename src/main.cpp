/// @file src/main.cpp
/// @brief adsim CLI entry point.
///
/// Usage:
///   adsim init                                       Create the schema
///   adsim seed-campaign <id> <name> <start> <end>    Insert a campaign + flight
///   adsim generate <campaign_id> [seed] [--no-replace]
///   adsim --help
///
/// Settings come from the environment (see adsim/config.hpp).

#include "adsim/config.hpp"
#include "adsim/log.hpp"
#include "adsim/orchestrator.hpp"
#include "adsim/sqlite_store.hpp"
#include "adsim/temporal.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  adsim init                                     Create the database schema\n"
        "  adsim seed-campaign <id> <name> <start> <end>  Insert a demo campaign + flight\n"
        "                                                 (dates as YYYY-MM-DD)\n"
        "  adsim generate <campaign_id> [seed] [--no-replace]\n"
        "                                                 Regenerate hourly metrics\n"
        "  adsim --help                                   Show this help\n"
        "\n"
        "Environment:\n"
        "  ADSIM_DB_PATH  ADSIM_LOG_LEVEL  ADSIM_PERSIST_DERIVED\n"
        "  ADSIM_BUSY_TIMEOUT_MS  ADSIM_ASSET_SECONDS\n"
    );
}

template <typename Int>
std::optional<Int> parse_int(std::string_view text) {
    Int value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/// Open the configured database and make sure the schema exists.
std::unique_ptr<adsim::storage::SqliteStore> open_store(const adsim::config::Settings& settings) {
    auto store = adsim::storage::SqliteStore::open(settings.db_path, settings.busy_timeout_ms);
    if (!store) {
        fmt::print(stderr, "Error: cannot open database '{}'\n", settings.db_path);
        return nullptr;
    }
    if (!store->initialize_schema()) {
        fmt::print(stderr, "Error: cannot create schema in '{}'\n", settings.db_path);
        return nullptr;
    }
    return store;
}

int run_init(const adsim::config::Settings& settings) {
    if (!open_store(settings)) {
        return 1;
    }
    fmt::print("Schema ready in '{}'\n", settings.db_path);
    return 0;
}

int run_seed_campaign(const adsim::config::Settings& settings, int argc, char* argv[]) {
    if (argc < 6) {
        fmt::print(stderr, "Error: seed-campaign requires <id> <name> <start> <end>\n");
        print_usage();
        return 1;
    }

    const auto id    = parse_int<adsim::CampaignId>(argv[2]);
    const auto start = adsim::temporal::parse_date(argv[4]);
    const auto end   = adsim::temporal::parse_date(argv[5]);
    if (!id) {
        fmt::print(stderr, "Error: invalid campaign id '{}'\n", argv[2]);
        return 1;
    }
    if (!start || !end) {
        fmt::print(stderr, "Error: dates must be YYYY-MM-DD\n");
        return 1;
    }
    if (*end < *start) {
        fmt::print(stderr, "Error: end date {} is before start date {}\n", argv[5], argv[4]);
        return 1;
    }

    auto store = open_store(settings);
    if (!store) {
        return 1;
    }

    if (!store->upsert_campaign(adsim::Campaign{.id = *id, .name = argv[3]})
        || !store->upsert_flight(adsim::Flight{.campaign_id = *id,
                                               .start_date  = *start,
                                               .end_date    = *end})) {
        const auto err = store->last_error();
        fmt::print(stderr, "Error: {}\n", err ? err->to_string() : "cannot seed campaign");
        return 1;
    }

    fmt::print("Campaign {} '{}' flight {} .. {}\n", *id, argv[3], argv[4], argv[5]);
    return 0;
}

int run_generate(const adsim::config::Settings& settings, int argc, char* argv[]) {
    if (argc < 3) {
        fmt::print(stderr, "Error: generate requires <campaign_id>\n");
        print_usage();
        return 1;
    }

    const auto id = parse_int<adsim::CampaignId>(argv[2]);
    if (!id) {
        fmt::print(stderr, "Error: invalid campaign id '{}'\n", argv[2]);
        return 1;
    }

    std::optional<adsim::RandomStream::Seed> seed;
    bool replace = true;
    for (int i = 3; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--no-replace") {
            replace = false;
            continue;
        }
        seed = parse_int<adsim::RandomStream::Seed>(arg);
        if (!seed) {
            fmt::print(stderr, "Error: invalid seed '{}'\n", arg);
            return 1;
        }
    }

    auto store = open_store(settings);
    if (!store) {
        return 1;
    }

    adsim::HourlyOrchestrator orchestrator(*store, adsim::OrchestratorConfig{
        .generator       = settings.generator,
        .persist_derived = settings.persist_derived,
    });

    const auto summary = orchestrator.run(*id, seed, replace);
    if (!summary) {
        const auto err = store->last_error();
        fmt::print(stderr, "Error: {}\n", err ? err->to_string() : "generation failed");
        return 1;
    }

    nlohmann::json out;
    out["campaign_id"] = summary->campaign_id;
    out["seed"]        = summary->seed;
    out["rows"]        = summary->rows;
    fmt::print("{}\n", out.dump());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto settings = adsim::config::Settings::from_env();
    adsim::log::set_level(settings.log_level);

    if (mode == "init") {
        return run_init(settings);
    }
    if (mode == "seed-campaign") {
        return run_seed_campaign(settings, argc, argv);
    }
    if (mode == "generate") {
        return run_generate(settings, argc, argv);
    }

    fmt::print(stderr, "Unknown command: {}\n", mode);
    print_usage();
    return 1;
}
