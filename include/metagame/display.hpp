#pragma once

#include "metagame/engine.hpp"
#include "metagame/types.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace metagame {

enum class OutputFormat {
    Table,
    Csv,
    Json,
};

std::optional<OutputFormat> parse_output_format(std::string_view name);

std::string rankings_csv(const RankingsReport& report);
std::string matchups_csv(const MatchupReport& report);

void print_rankings(const RankingsReport& report, OutputFormat format, std::ostream& out);
void print_matchups(const MatchupReport& report, OutputFormat format, std::ostream& out);

struct BrowseOptions {
    std::string format;
    int current_days = 14;
    int previous_days = 14;
    int matchup_days = 14;
};

// Full-screen tabbed view over rankings, grouped rankings and the matchup matrix.
void run_browser(const MetaAnalyticsEngine& engine, const BrowseOptions& options);

} // namespace metagame
