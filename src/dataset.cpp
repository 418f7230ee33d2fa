#include "metagame/dataset.hpp"
#include "metagame/time_window.hpp"
#include <fstream>

namespace metagame {

namespace {

TimePoint parse_epoch(int64_t epoch_secs) {
    return std::chrono::system_clock::from_time_t(static_cast<time_t>(epoch_secs));
}

std::optional<int64_t> safe_int(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer())
        return j[key].get<int64_t>();
    return std::nullopt;
}

std::optional<std::string> safe_str(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

// Player ids come through as text or integers depending on the exporter.
std::optional<std::string> safe_id(const nlohmann::json& j, const std::string& key) {
    if (auto s = safe_str(j, key)) return s;
    if (auto n = safe_int(j, key)) return std::to_string(*n);
    return std::nullopt;
}

std::optional<TimePoint> safe_date(const nlohmann::json& j, const std::string& key) {
    if (auto epoch = safe_int(j, key)) return parse_epoch(*epoch);
    if (auto iso = safe_str(j, key)) return parse_iso8601(*iso);
    return std::nullopt;
}

bool in_window(TimePoint t, TimePoint start, TimePoint end) {
    return t >= start && t < end;
}

} // namespace

std::optional<ArchetypeRow> parse_archetype_row(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    auto id = safe_int(j, "archetype_id");
    auto format = safe_str(j, "format");
    auto title = safe_str(j, "main_title");
    auto strategy = safe_str(j, "strategy");
    auto date = safe_date(j, "tournament_date");
    if (!id || !format || !title || !strategy || !date) return std::nullopt;

    return ArchetypeRow{
        .archetype_id = *id,
        .format = *format,
        .main_title = *title,
        .color_identity = safe_str(j, "color_identity"),
        .strategy = *strategy,
        .tournament_date = *date,
    };
}

std::optional<MatchRow> parse_match_row(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    auto format = safe_str(j, "format");
    auto player_id = safe_int(j, "player_archetype_id");
    auto player_name = safe_str(j, "player_archetype");
    auto opponent_id = safe_int(j, "opponent_archetype_id");
    auto opponent_name = safe_str(j, "opponent_archetype");
    auto p1 = safe_id(j, "player1_id");
    auto p2 = safe_id(j, "player2_id");
    auto winner = safe_id(j, "winner_id");
    auto date = safe_date(j, "tournament_date");

    if (!format || !player_id || !player_name || !opponent_id || !opponent_name ||
        !p1 || !p2 || !date) {
        return std::nullopt;
    }

    // Unfinished and drawn matches carry no winner
    if (!winner || (*winner != *p1 && *winner != *p2)) return std::nullopt;

    return MatchRow{
        .format = *format,
        .player_archetype_id = *player_id,
        .player_archetype_name = *player_name,
        .opponent_archetype_id = *opponent_id,
        .opponent_archetype_name = *opponent_name,
        .player1_id = *p1,
        .player2_id = *p2,
        .winner_id = *winner,
        .tournament_date = *date,
    };
}

Dataset::Dataset(std::vector<ArchetypeRow> archetypes, std::vector<MatchRow> matches)
    : archetypes_(std::move(archetypes)), matches_(std::move(matches)) {}

std::vector<ArchetypeRow> Dataset::archetypes(
    const std::string& format, TimePoint start, TimePoint end) const {
    std::vector<ArchetypeRow> result;
    for (auto& row : archetypes_) {
        if (row.format == format && in_window(row.tournament_date, start, end)) {
            result.push_back(row);
        }
    }
    return result;
}

std::vector<MatchRow> Dataset::matches(
    const std::string& format, TimePoint start, TimePoint end) const {
    std::vector<MatchRow> result;
    for (auto& row : matches_) {
        if (row.format == format && in_window(row.tournament_date, start, end)) {
            result.push_back(row);
        }
    }
    return result;
}

std::expected<Dataset, AnalyticsError> Dataset::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(AnalyticsError{ErrorKind::Upstream,
                                              "dataset must be a JSON object"});
    }

    Dataset ds;
    for (auto* key : {"archetypes", "matches"}) {
        if (j.contains(key) && !j[key].is_array()) {
            return std::unexpected(AnalyticsError{
                ErrorKind::Upstream, std::string("dataset field '") + key + "' must be an array"});
        }
    }

    if (j.contains("archetypes")) {
        for (auto& entry : j["archetypes"]) {
            if (auto row = parse_archetype_row(entry)) ds.archetypes_.push_back(std::move(*row));
            else ds.skipped_++;
        }
    }

    if (j.contains("matches")) {
        for (auto& entry : j["matches"]) {
            if (auto row = parse_match_row(entry)) ds.matches_.push_back(std::move(*row));
            else ds.skipped_++;
        }
    }

    return ds;
}

std::expected<Dataset, AnalyticsError> load_dataset(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(AnalyticsError{ErrorKind::Upstream,
                                              "dataset not found: " + path.string()});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(AnalyticsError{ErrorKind::Upstream,
                                              "cannot open dataset: " + path.string()});
    }

    try {
        return Dataset::parse(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(AnalyticsError{
            ErrorKind::Upstream, "dataset " + path.string() + ": JSON parse error: " + e.what()});
    }
}

RowSource make_row_source(std::shared_ptr<const Dataset> dataset) {
    return RowSource{
        .archetypes = [dataset](const std::string& format, TimePoint start, TimePoint end)
            -> std::expected<std::vector<ArchetypeRow>, AnalyticsError> {
            return dataset->archetypes(format, start, end);
        },
        .matches = [dataset](const std::string& format, TimePoint start, TimePoint end)
            -> std::expected<std::vector<MatchRow>, AnalyticsError> {
            return dataset->matches(format, start, end);
        },
    };
}

} // namespace metagame
