#pragma once

#include "metagame/types.hpp"
#include <string_view>
#include <nlohmann/json.hpp>

namespace metagame {

// Absent values serialize as null.
void to_json(nlohmann::json& j, const Period& p);
void to_json(nlohmann::json& j, const ReportMetadata& m);
void to_json(nlohmann::json& j, const RankingRow& r);
void to_json(nlohmann::json& j, const MatchupCell& c);
void to_json(nlohmann::json& j, const RankingsReport& r);
void to_json(nlohmann::json& j, const MatchupReport& r);
void to_json(nlohmann::json& j, const AnalyticsError& e);

nlohmann::json make_error_body(std::string_view error, std::string_view message);

std::string_view error_kind_name(ErrorKind kind);

} // namespace metagame
