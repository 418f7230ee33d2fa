#pragma once

#include "metagame/engine.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace metagame {

// Same shape as httplib::Params.
using QueryParams = std::multimap<std::string, std::string>;

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// GET /archetypes?format=&current_days=&previous_days=&previous_start_days=&previous_end_days=
//                 &color_identity=&strategy=&group_by=&min_matches=
ApiResponse handle_archetypes(const MetaAnalyticsEngine& engine, const QueryParams& params);

// GET /matchups?format=&days=&min_matches=
ApiResponse handle_matchups(const MetaAnalyticsEngine& engine, const QueryParams& params);

ApiResponse handle_health();

// Blocks until the server stops. Returns false if the socket could not be bound.
bool serve(const MetaAnalyticsEngine& engine, const std::string& host, int port);

} // namespace metagame
