#pragma once

#include "metagame/engine.hpp"
#include "metagame/types.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace metagame {

// Tournament rows exported by the ingestion pipeline, held in memory.
class Dataset {
public:
    Dataset() = default;
    Dataset(std::vector<ArchetypeRow> archetypes, std::vector<MatchRow> matches);

    std::vector<ArchetypeRow> archetypes(const std::string& format,
                                         TimePoint start, TimePoint end) const;
    std::vector<MatchRow> matches(const std::string& format,
                                  TimePoint start, TimePoint end) const;

    size_t archetype_count() const { return archetypes_.size(); }
    size_t match_count() const { return matches_.size(); }
    size_t skipped_count() const { return skipped_; }

    static std::expected<Dataset, AnalyticsError> parse(const nlohmann::json& j);

private:
    std::vector<ArchetypeRow> archetypes_;
    std::vector<MatchRow> matches_;
    size_t skipped_ = 0;
};

std::expected<Dataset, AnalyticsError> load_dataset(const std::filesystem::path& path);

// Entries missing a required field yield std::nullopt.
std::optional<ArchetypeRow> parse_archetype_row(const nlohmann::json& j);

// Matches without a winner, or whose winner is neither player, yield std::nullopt.
std::optional<MatchRow> parse_match_row(const nlohmann::json& j);

RowSource make_row_source(std::shared_ptr<const Dataset> dataset);

} // namespace metagame
