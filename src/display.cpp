#include "metagame/display.hpp"
#include "metagame/report_json.hpp"
#include "metagame/time_window.hpp"
#include <expected>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/node.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace metagame {

namespace {

using namespace ftxui;

std::string fixed(double v, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

std::string fpct(std::optional<double> v) {
    if (!v) return "-";
    return fixed(*v, 1) + "%";
}

std::string fdelta(std::optional<double> v) {
    if (!v) return "new";
    if (*v > 0) return "+" + fixed(*v, 1);
    return fixed(*v, 1);
}

std::string fcount(std::optional<int> v) {
    return v ? std::to_string(*v) : "-";
}

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string quoted = "\"";
    for (char c : s) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

std::string csv_num(std::optional<double> v) {
    return v ? fixed(*v, 2) : "";
}

std::string csv_int(std::optional<int> v) {
    return v ? std::to_string(*v) : "";
}

Color wr_color(std::optional<double> wr) {
    if (!wr) return Color::GrayDark;
    if (*wr >= 55.0) return Color::Green;
    if (*wr >= 45.0) return Color::Yellow;
    return Color::Red;
}

Color delta_color(std::optional<double> delta) {
    if (!delta) return Color::Cyan;
    if (*delta > 0) return Color::Green;
    if (*delta < 0) return Color::Red;
    return Color::GrayDark;
}

Element render_period_line(const ReportMetadata& meta) {
    Elements parts = {
        text(" " + meta.format) | bold,
        text("  |  "),
        text("Current: " + to_iso8601(meta.current.start) + " .. " + to_iso8601(meta.current.end)),
    };
    if (meta.previous) {
        parts.push_back(text("  |  "));
        parts.push_back(text("Previous: " + to_iso8601(meta.previous->start) + " .. " +
                             to_iso8601(meta.previous->end)));
    }
    return hbox(parts) | borderLight | color(Color::Cyan);
}

Element render_rankings(const RankingsReport& report) {
    if (report.rows.empty()) return text("No archetype data for this window.") | dim;

    bool grouped = report.rows.front().grouped;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({grouped ? "Group" : "Archetype", "Colors", "Strategy",
                    "Share", "Prev", "Delta", "Win Rate", "Prev WR",
                    "Decks", "Matches"});
    for (auto& r : report.rows) {
        rows.push_back({
            grouped ? r.strategy : r.main_title,
            r.color_identity.value_or("-"),
            r.strategy,
            fpct(r.meta_share_current),
            fpct(r.meta_share_previous),
            fdelta(r.meta_share_delta()),
            fpct(r.win_rate_current),
            fpct(r.win_rate_previous),
            std::to_string(r.sample_size_current),
            fcount(r.match_count_current),
        });
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);

    for (size_t i = 1; i < rows.size(); ++i) {
        auto& r = report.rows[i - 1];
        table.SelectCell(5, i).Decorate(color(delta_color(r.meta_share_delta())));
        table.SelectCell(6, i).Decorate(color(wr_color(r.win_rate_current)));
        table.SelectCell(7, i).Decorate(color(wr_color(r.win_rate_previous)));
    }

    Elements content = {table.Render()};
    if (grouped) {
        content.push_back(text("  Grouped win rates are an unweighted mean of member archetypes.") | dim);
    }
    return vbox(content);
}

Element render_matrix(const MatchupReport& report) {
    if (report.matrix.empty()) return text("No matchup data for this window.") | dim;

    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> header = {"Player \\ Opponent"};
    for (auto& name : report.archetypes) header.push_back(name);
    rows.push_back(std::move(header));

    for (auto& player : report.archetypes) {
        std::vector<std::string> row = {player};
        auto& opponents = report.matrix.at(player);
        for (auto& opponent : report.archetypes) {
            auto it = opponents.find(opponent);
            if (it == opponents.end()) {
                row.push_back("");
            } else {
                row.push_back(fpct(it->second.win_rate) + " (" +
                              std::to_string(it->second.match_count) + ")");
            }
        }
        rows.push_back(std::move(row));
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectColumn(0).Decorate(bold);
    table.SelectAll().Border(LIGHT);

    for (size_t i = 0; i < report.archetypes.size(); ++i) {
        auto& opponents = report.matrix.at(report.archetypes[i]);
        for (size_t k = 0; k < report.archetypes.size(); ++k) {
            auto it = opponents.find(report.archetypes[k]);
            if (it == opponents.end()) continue;
            table.SelectCell(k + 1, i + 1).Decorate(color(wr_color(it->second.win_rate)));
        }
    }

    return vbox({
        table.Render(),
        text("  Cells: win rate of the row archetype (directional observations).") | dim,
    });
}

template <typename Report>
Element render_result(const std::expected<Report, AnalyticsError>& result,
                      Element (*render)(const Report&)) {
    if (!result) {
        return text(std::string(error_kind_name(result.error().kind)) + ": " +
                    result.error().message) | color(Color::Red);
    }
    return render(*result);
}

// Everything the browser shows, recomputed on reload.
struct BrowserViews {
    std::expected<RankingsReport, AnalyticsError> rankings;
    std::expected<RankingsReport, AnalyticsError> by_strategy;
    std::expected<RankingsReport, AnalyticsError> by_color;
    std::expected<MatchupReport, AnalyticsError> matchups;
};

BrowserViews load_views(const MetaAnalyticsEngine& engine, const BrowseOptions& options) {
    RankingsQuery base{
        .format = options.format,
        .current_days = options.current_days,
        .previous_days = options.previous_days,
    };
    auto grouped = [&](const char* field) {
        auto query = base;
        query.group_by = field;
        return engine.rankings(query);
    };

    return {
        .rankings = engine.rankings(base),
        .by_strategy = grouped("strategy"),
        .by_color = grouped("color_identity"),
        .matchups = engine.matchup_matrix({.format = options.format, .days = options.matchup_days}),
    };
}

// Screen sized to the element rather than the terminal.
void print_element(Element doc, std::ostream& out) {
    doc->ComputeRequirement();
    auto req = doc->requirement();
    auto screen = Screen::Create(Dimension::Fixed(req.min_x), Dimension::Fixed(req.min_y));
    Render(screen, doc);
    out << screen.ToString() << "\n";
}

} // namespace

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "table") return OutputFormat::Table;
    if (name == "csv") return OutputFormat::Csv;
    if (name == "json") return OutputFormat::Json;
    return std::nullopt;
}

std::string rankings_csv(const RankingsReport& report) {
    std::ostringstream out;
    out << "main_title,color_identity,strategy,meta_share_current,meta_share_previous,"
           "win_rate_current,win_rate_previous,sample_size_current,sample_size_previous,"
           "match_count_current,match_count_previous\n";
    for (auto& r : report.rows) {
        out << csv_field(r.main_title) << ','
            << csv_field(r.color_identity.value_or("")) << ','
            << csv_field(r.strategy) << ','
            << fixed(r.meta_share_current, 2) << ','
            << csv_num(r.meta_share_previous) << ','
            << csv_num(r.win_rate_current) << ','
            << csv_num(r.win_rate_previous) << ','
            << r.sample_size_current << ','
            << csv_int(r.sample_size_previous) << ','
            << csv_int(r.match_count_current) << ','
            << csv_int(r.match_count_previous) << '\n';
    }
    return out.str();
}

std::string matchups_csv(const MatchupReport& report) {
    std::ostringstream out;
    out << "player_archetype,opponent_archetype,win_rate,wins,match_count\n";
    for (auto& [player, opponents] : report.matrix) {
        for (auto& [opponent, cell] : opponents) {
            out << csv_field(player) << ',' << csv_field(opponent) << ','
                << csv_num(cell.win_rate) << ',' << cell.wins << ','
                << cell.match_count << '\n';
        }
    }
    return out.str();
}

void print_rankings(const RankingsReport& report, OutputFormat format, std::ostream& out) {
    switch (format) {
        case OutputFormat::Csv:
            out << rankings_csv(report);
            return;
        case OutputFormat::Json:
            out << nlohmann::json(report).dump(2) << "\n";
            return;
        case OutputFormat::Table:
            print_element(vbox({
                render_period_line(report.metadata),
                text("Archetype Rankings") | bold | color(Color::Cyan),
                separator(),
                render_rankings(report),
            }), out);
            return;
    }
}

void print_matchups(const MatchupReport& report, OutputFormat format, std::ostream& out) {
    switch (format) {
        case OutputFormat::Csv:
            out << matchups_csv(report);
            return;
        case OutputFormat::Json:
            out << nlohmann::json(report).dump(2) << "\n";
            return;
        case OutputFormat::Table:
            print_element(vbox({
                render_period_line(report.metadata),
                text("Matchup Matrix") | bold | color(Color::Cyan),
                separator(),
                render_matrix(report),
            }), out);
            return;
    }
}

void run_browser(const MetaAnalyticsEngine& engine, const BrowseOptions& options) {
    auto views = load_views(engine, options);

    std::vector<std::string> tab_labels = {"Rankings", "By Strategy", "By Color", "Matchups"};
    int selected_tab = 0;
    auto tabs = Toggle(&tab_labels, &selected_tab);

    auto pages = Container::Tab({
        Renderer([&] { return render_result(views.rankings, render_rankings); }),
        Renderer([&] { return render_result(views.by_strategy, render_rankings); }),
        Renderer([&] { return render_result(views.by_color, render_rankings); }),
        Renderer([&] { return render_result(views.matchups, render_matrix); }),
    }, &selected_tab);

    auto layout = Container::Vertical({tabs, pages});
    auto screen = ScreenInteractive::Fullscreen();
    std::string threshold = "min " + std::to_string(engine.min_matches()) + " matches for a win rate ";

    auto app = Renderer(layout, [&] {
        Element header = views.rankings ? render_period_line(views.rankings->metadata)
                                        : text(" " + options.format) | bold;
        return vbox({
            header,
            tabs->Render() | color(Color::Cyan),
            separator(),
            pages->Render() | flex | yframe,
            separator(),
            hbox({
                text(" [←/→] Switch view") | dim,
                text("  [r] Reload") | dim,
                text("  [q] Quit") | dim,
                filler(),
                text(threshold) | dim,
            }),
        }) | borderRounded;
    });

    auto with_keys = CatchEvent(app, [&](Event event) {
        if (event == Event::Character('q') || event == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (event == Event::Character('r')) {
            views = load_views(engine, options);
            return true;
        }
        return false;
    });

    screen.Loop(with_keys);
}

} // namespace metagame
