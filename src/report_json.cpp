#include "metagame/report_json.hpp"
#include "metagame/time_window.hpp"

namespace metagame {

namespace {

template <typename T>
nlohmann::json opt(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // namespace

void to_json(nlohmann::json& j, const Period& p) {
    j = {
        {"days", p.days},
        {"start_date", to_iso8601(p.start)},
        {"end_date", to_iso8601(p.end)},
    };
}

void to_json(nlohmann::json& j, const ReportMetadata& m) {
    j = {
        {"format", m.format},
        {"current_period", m.current},
        {"timestamp", to_iso8601(m.generated_at)},
    };
    if (m.previous) j["previous_period"] = *m.previous;
}

void to_json(nlohmann::json& j, const RankingRow& r) {
    j = {
        {"archetype_id", opt(r.archetype_id)},
        {"main_title", r.main_title},
        {"color_identity", opt(r.color_identity)},
        {"strategy", r.strategy},
        {"meta_share_current", r.meta_share_current},
        {"meta_share_previous", opt(r.meta_share_previous)},
        {"win_rate_current", opt(r.win_rate_current)},
        {"win_rate_previous", opt(r.win_rate_previous)},
        {"sample_size_current", r.sample_size_current},
        {"sample_size_previous", opt(r.sample_size_previous)},
        {"match_count_current", opt(r.match_count_current)},
        {"match_count_previous", opt(r.match_count_previous)},
        {"grouped", r.grouped},
    };
}

void to_json(nlohmann::json& j, const MatchupCell& c) {
    j = {
        {"win_rate", opt(c.win_rate)},
        {"match_count", c.match_count},
    };
}

void to_json(nlohmann::json& j, const RankingsReport& r) {
    j = {
        {"data", r.rows},
        {"metadata", r.metadata},
    };
}

void to_json(nlohmann::json& j, const MatchupReport& r) {
    j = {
        {"matrix", r.matrix},
        {"archetypes", r.archetypes},
        {"metadata", r.metadata},
    };
}

void to_json(nlohmann::json& j, const AnalyticsError& e) {
    j = make_error_body(error_kind_name(e.kind), e.message);
}

nlohmann::json make_error_body(std::string_view error, std::string_view message) {
    return {
        {"error", error},
        {"message", message},
    };
}

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "Validation Error";
        case ErrorKind::Upstream: return "Upstream Failure";
    }
    return "Error";
}

} // namespace metagame
