#include "metagame/config.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string_view>
#include <utility>

namespace metagame {

namespace {

constexpr std::string_view whitespace = " \t\r\n";

std::string_view trim(std::string_view sv) {
    auto first = sv.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = sv.find_last_not_of(whitespace);
    return sv.substr(first, last - first + 1);
}

std::string_view unquote(std::string_view sv) {
    if (sv.size() < 2) return sv;
    char q = sv.front();
    if ((q == '"' || q == '\'') && sv.back() == q) return sv.substr(1, sv.size() - 2);
    return sv;
}

// KEY=value, optionally prefixed with "export". Comments and malformed lines yield nothing.
std::optional<std::pair<std::string, std::string>> parse_env_line(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') return std::nullopt;
    if (line.starts_with("export ")) line = trim(line.substr(7));

    auto eq = line.find('=');
    if (eq == std::string_view::npos) return std::nullopt;

    auto key = trim(line.substr(0, eq));
    if (key.empty()) return std::nullopt;
    return std::pair{std::string(key), std::string(unquote(trim(line.substr(eq + 1))))};
}

std::optional<int> parse_int(std::string_view s) {
    s = trim(s);
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace

std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path) {
    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file) return vars;

    for (std::string line; std::getline(file, line);) {
        auto entry = parse_env_line(line);
        if (!entry) continue;
        // Existing variables are not overwritten
        ::setenv(entry->first.c_str(), entry->second.c_str(), 0);
        vars.insert_or_assign(std::move(entry->first), std::move(entry->second));
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    if (!val) return std::nullopt;
    return std::string(val);
}

std::optional<int> get_env_int(const std::string& key) {
    auto val = get_env(key);
    if (!val) return std::nullopt;
    return parse_int(*val);
}

AppConfig load_config() {
    AppConfig config;

    if (auto path = get_env("METAGAME_DATA_PATH"); path && !path->empty()) {
        config.data_path = *path;
    }
    if (auto host = get_env("METAGAME_HOST"); host && !host->empty()) {
        config.host = *host;
    }
    if (get_env("METAGAME_MIN_MATCHES")) {
        auto min = get_env_int("METAGAME_MIN_MATCHES");
        if (min && *min >= 1) config.min_matches = *min;
        else std::cerr << "Ignoring METAGAME_MIN_MATCHES: expected an integer >= 1\n";
    }
    if (get_env("METAGAME_PORT")) {
        auto port = get_env_int("METAGAME_PORT");
        if (port && *port > 0 && *port <= 65535) config.port = *port;
        else std::cerr << "Ignoring METAGAME_PORT: expected a port number\n";
    }

    return config;
}

} // namespace metagame
