#include "metagame/config.hpp"
#include "metagame/dataset.hpp"
#include "metagame/display.hpp"
#include "metagame/engine.hpp"
#include "metagame/http_api.hpp"
#include "metagame/query.hpp"
#include "metagame/report_json.hpp"
#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct CliArgs {
    std::string command;
    std::string format;
    metagame::RankingsQuery rankings;
    metagame::MatchupQuery matchups;
    std::optional<int> previous_start_days;
    std::optional<int> previous_end_days;
    std::optional<std::string> data_path;
    std::optional<int> min_matches;
    std::optional<int> port;
    metagame::OutputFormat output = metagame::OutputFormat::Table;
};

void print_usage() {
    std::cerr << R"(Usage: metagame-analytics <command> [format] [options]

Commands:
  rankings <format>          Archetype meta share and win rate, current vs previous
  matchups <format>          Head-to-head matchup matrix
  browse <format>            Interactive view of rankings and matchups
  serve                      HTTP API (/archetypes, /matchups, /health)

Options:
  --data <path>              Dataset JSON (default: $METAGAME_DATA_PATH or data/metagame.json)
  --min-matches <n>          Minimum observations for a win rate (default: 3)
  --output <table|csv|json>  Output format (default: table)
  --current-days <n>         Current period length (default: 14)
  --previous-days <n>        Previous period length (default: 14)
  --previous-start-days <n>  Previous period start, days ago (with --previous-end-days)
  --previous-end-days <n>    Previous period end, days ago
  --color-identity <name>    Filter rankings by color identity
  --strategy <name>          Filter rankings by strategy (aggro|midrange|control|ramp|combo)
  --group-by <field>         Group rankings by color_identity or strategy
  --days <n>                 Matchup window length (default: 14)
  --port <n>                 HTTP port for serve (default: $METAGAME_PORT or 8080)
)";
}

std::optional<int> to_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.command = argv[1];
    if (args.command != "rankings" && args.command != "matchups" &&
        args.command != "browse" && args.command != "serve") {
        std::cerr << "Unknown command: " << args.command << "\n";
        return std::nullopt;
    }

    int i = 2;
    if (args.command != "serve") {
        if (argc < 3) return std::nullopt;
        args.format = argv[2];
        i = 3;
    }

    for (; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[i + 1];

        auto int_value = [&]() -> std::optional<int> {
            auto n = to_int(val);
            if (!n) std::cerr << "Expected an integer for " << flag << ", got '" << val << "'\n";
            return n;
        };

        if (flag == "--data") args.data_path = val;
        else if (flag == "--color-identity") args.rankings.color_identity = val;
        else if (flag == "--strategy") args.rankings.strategy = val;
        else if (flag == "--group-by") args.rankings.group_by = val;
        else if (flag == "--output") {
            auto format = metagame::parse_output_format(val);
            if (!format) {
                std::cerr << "Unknown output format: " << val << "\n";
                return std::nullopt;
            }
            args.output = *format;
        }
        else if (flag == "--current-days" || flag == "--previous-days" ||
                 flag == "--previous-start-days" || flag == "--previous-end-days" ||
                 flag == "--days" || flag == "--min-matches" || flag == "--port") {
            auto n = int_value();
            if (!n) return std::nullopt;
            if (flag == "--current-days") args.rankings.current_days = *n;
            else if (flag == "--previous-days") args.rankings.previous_days = *n;
            else if (flag == "--previous-start-days") args.previous_start_days = *n;
            else if (flag == "--previous-end-days") args.previous_end_days = *n;
            else if (flag == "--days") args.matchups.days = *n;
            else if (flag == "--min-matches") args.min_matches = *n;
            else args.port = *n;
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    if (args.previous_start_days.has_value() != args.previous_end_days.has_value()) {
        std::cerr << "--previous-start-days and --previous-end-days must be given together\n";
        return std::nullopt;
    }
    if (args.previous_start_days) {
        args.rankings.previous_offsets =
            metagame::PreviousOffsets{*args.previous_start_days, *args.previous_end_days};
    }

    args.rankings.format = args.format;
    args.matchups.format = args.format;
    return args;
}

int report_error(const metagame::AnalyticsError& error) {
    std::cerr << metagame::error_kind_name(error.kind) << ": " << error.message << "\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    metagame::load_env();
    auto config = metagame::load_config();
    if (args->data_path) config.data_path = *args->data_path;
    if (args->port) config.port = *args->port;
    if (args->min_matches) {
        auto min = metagame::validate_min_matches(*args->min_matches);
        if (!min) return report_error(min.error());
        config.min_matches = *min;
    }

    // Load dataset
    std::cerr << "Loading " << config.data_path.string() << "...\n";
    auto dataset = metagame::load_dataset(config.data_path);
    if (!dataset) return report_error(dataset.error());

    std::cerr << "Loaded " << dataset->archetype_count() << " decklists and "
              << dataset->match_count() << " matches";
    if (dataset->skipped_count() > 0) {
        std::cerr << " (skipped " << dataset->skipped_count() << " incomplete rows)";
    }
    std::cerr << "\n";

    auto shared = std::make_shared<const metagame::Dataset>(std::move(*dataset));
    metagame::MetaAnalyticsEngine engine(metagame::make_row_source(shared), config.min_matches);

    if (args->command == "rankings") {
        auto query = metagame::normalize_rankings_query(args->rankings);
        if (!query) return report_error(query.error());

        auto report = engine.rankings(*query);
        if (!report) return report_error(report.error());

        if (report->rows.empty()) {
            std::cerr << "No archetype data found for format '" << query->format
                      << "' in the specified time window.\n";
            return 0;
        }
        metagame::print_rankings(*report, args->output, std::cout);
        return 0;
    }

    if (args->command == "matchups") {
        auto query = metagame::normalize_matchup_query(args->matchups);
        if (!query) return report_error(query.error());

        auto report = engine.matchup_matrix(*query);
        if (!report) return report_error(report.error());

        if (report->matrix.empty()) {
            std::cerr << "No matchup data found for format '" << query->format
                      << "' in the last " << query->days << " days.\n";
            return 0;
        }
        metagame::print_matchups(*report, args->output, std::cout);
        return 0;
    }

    if (args->command == "browse") {
        auto rankings = metagame::normalize_rankings_query(args->rankings);
        if (!rankings) return report_error(rankings.error());
        auto matchups = metagame::normalize_matchup_query(args->matchups);
        if (!matchups) return report_error(matchups.error());

        metagame::run_browser(engine, {
            .format = rankings->format,
            .current_days = rankings->current_days,
            .previous_days = rankings->previous_days,
            .matchup_days = matchups->days,
        });
        return 0;
    }

    return metagame::serve(engine, config.host, config.port) ? 0 : 1;
}
