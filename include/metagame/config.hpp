#pragma once

#include "metagame/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace metagame {

struct AppConfig {
    std::filesystem::path data_path = "data/metagame.json";
    int min_matches = default_min_matches;
    std::string host = "0.0.0.0";
    int port = 8080;
};

// Reads KEY=value lines into the environment without overwriting existing vars.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);
std::optional<int> get_env_int(const std::string& key);

// METAGAME_DATA_PATH, METAGAME_MIN_MATCHES, METAGAME_HOST, METAGAME_PORT
AppConfig load_config();

} // namespace metagame
