#include "metagame/http_api.hpp"
#include "metagame/query.hpp"
#include "metagame/report_json.hpp"
#include "metagame/time_window.hpp"
#include <httplib.h>
#include <charconv>
#include <iostream>

namespace metagame {

namespace {

std::optional<std::string> param(const QueryParams& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::expected<std::optional<int>, AnalyticsError> int_param(
    const QueryParams& params, const std::string& key) {
    auto raw = param(params, key);
    if (!raw) return std::optional<int>{};

    int value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::unexpected(AnalyticsError{
            ErrorKind::Validation, key + " must be an integer, got '" + *raw + "'"});
    }
    return std::optional<int>(value);
}

ApiResponse error_response(const AnalyticsError& error) {
    if (error.kind == ErrorKind::Validation) {
        return {400, make_error_body("Bad Request", error.message)};
    }
    std::cerr << "Upstream failure: " << error.message << "\n";
    return {500, make_error_body("Internal Server Error", error.message)};
}

ApiResponse not_found(const std::string& message) {
    return {404, make_error_body("No Data Available", message)};
}

} // namespace

ApiResponse handle_archetypes(const MetaAnalyticsEngine& engine, const QueryParams& params) {
    RankingsQuery query{
        .format = param(params, "format").value_or(""),
        .color_identity = param(params, "color_identity"),
        .strategy = param(params, "strategy"),
        .group_by = param(params, "group_by"),
    };

    for (auto [key, target] : {std::pair{"current_days", &query.current_days},
                               std::pair{"previous_days", &query.previous_days}}) {
        auto value = int_param(params, key);
        if (!value) return error_response(value.error());
        if (*value) *target = **value;
    }

    auto min_matches = int_param(params, "min_matches");
    if (!min_matches) return error_response(min_matches.error());
    query.min_matches = *min_matches;

    auto start_ago = int_param(params, "previous_start_days");
    if (!start_ago) return error_response(start_ago.error());
    auto end_ago = int_param(params, "previous_end_days");
    if (!end_ago) return error_response(end_ago.error());
    if (start_ago->has_value() != end_ago->has_value()) {
        return error_response({ErrorKind::Validation,
                               "previous_start_days and previous_end_days must be given together"});
    }
    if (*start_ago) {
        query.previous_offsets = PreviousOffsets{**start_ago, **end_ago};
    }

    auto normalized = normalize_rankings_query(std::move(query));
    if (!normalized) return error_response(normalized.error());

    auto report = engine.rankings(*normalized);
    if (!report) return error_response(report.error());

    if (report->rows.empty()) {
        return not_found("No archetype data found for format '" + normalized->format +
                         "' in the specified time window");
    }
    return {200, *report};
}

ApiResponse handle_matchups(const MetaAnalyticsEngine& engine, const QueryParams& params) {
    MatchupQuery query{.format = param(params, "format").value_or("")};

    auto days = int_param(params, "days");
    if (!days) return error_response(days.error());
    if (*days) query.days = **days;

    auto min_matches = int_param(params, "min_matches");
    if (!min_matches) return error_response(min_matches.error());
    query.min_matches = *min_matches;

    auto normalized = normalize_matchup_query(std::move(query));
    if (!normalized) return error_response(normalized.error());

    auto report = engine.matchup_matrix(*normalized);
    if (!report) return error_response(report.error());

    if (report->matrix.empty()) {
        return not_found("No matchup data found for format '" + normalized->format +
                         "' in the last " + std::to_string(normalized->days) + " days");
    }
    return {200, *report};
}

ApiResponse handle_health() {
    return {200, {
        {"status", "healthy"},
        {"timestamp", to_iso8601(std::chrono::system_clock::now())},
    }};
}

bool serve(const MetaAnalyticsEngine& engine, const std::string& host, int port) {
    httplib::Server server;

    auto route = [&](const std::string& path, auto handler) {
        server.Get(path, [path, handler](const httplib::Request& req, httplib::Response& res) {
            auto started = std::chrono::steady_clock::now();
            ApiResponse reply = handler(req);
            res.status = reply.status;
            res.set_content(reply.body.dump(), "application/json");

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            std::cerr << req.method << " " << path << " " << reply.status
                      << " " << elapsed.count() << "ms\n";
        });
    };

    route("/archetypes", [&engine](const httplib::Request& req) {
        return handle_archetypes(engine, req.params);
    });
    route("/matchups", [&engine](const httplib::Request& req) {
        return handle_matchups(engine, req.params);
    });
    route("/health", [](const httplib::Request&) { return handle_health(); });

    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        res.set_content(make_error_body("Not Found", "no route for " + req.path).dump(),
                        "application/json");
    });

    std::cerr << "Serving meta analytics on " << host << ":" << port << "\n";
    if (!server.listen(host, port)) {
        std::cerr << "Failed to bind " << host << ":" << port << "\n";
        return false;
    }
    return true;
}

} // namespace metagame
