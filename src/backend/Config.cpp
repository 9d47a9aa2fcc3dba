#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace lyricflow::backend {

namespace {
    std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

Config ConfigLoader::load() {
    return load(process_environment());
}

Config ConfigLoader::load(const EnvLookup& env) {
    lyricflow::util::Logger::debug("Config: Loading configuration");

    Config cfg;
    if (auto file = env("LYRICFLOW_CONFIG"); file && !file->empty()) {
        if (!std::filesystem::exists(*file)) {
            throw ConfigError("Config file not found: " + *file);
        }
        cfg = load_from_file(*file, cfg);
    }

    apply_environment(cfg, env);
    validate(cfg);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path, Config cfg) {
    lyricflow::util::Logger::debug("Config: Loading from file " + path.string());

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot read config file: " + path.string());
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "library") {
            if (key == "music_path") cfg.music_paths = parse_paths(value);
            else if (key == "scan_interval_days") cfg.scan_interval_days = parse_int(key, value, 0);
            else if (key == "use_folder_structure") cfg.use_folder_structure = parse_bool(value);
            else if (key == "default_artist") cfg.default_artist = value;
        }
        else if (current_section == "download") {
            if (key == "lyrics") cfg.download_lyrics = parse_bool(value);
            else if (key == "cover") cfg.download_cover = parse_bool(value);
            else if (key == "overwrite_lyrics") cfg.overwrite_lyrics = parse_bool(value);
            else if (key == "overwrite_cover") cfg.overwrite_cover = parse_bool(value);
        }
        else if (current_section == "update") {
            if (key == "lyrics") cfg.update_lyrics = parse_bool(value);
            else if (key == "cover") cfg.update_cover = parse_bool(value);
            else if (key == "basic_info") cfg.update_basic_info = parse_bool(value);
        }
        else if (current_section == "provider") {
            if (key == "name") cfg.provider = parse_provider(value);
            else if (key == "api_base_url") cfg.api_base_url = strip_trailing_slash(value);
            else if (key == "platforms") cfg.platforms = parse_list(value);
            else if (key == "lrcapi_url") cfg.lrcapi_url = strip_trailing_slash(value);
            else if (key == "lrcapi_auth") cfg.lrcapi_auth = value;
        }
        else if (current_section == "network") {
            if (key == "workers") cfg.workers = parse_int(key, value, 1);
            else if (key == "request_timeout_seconds") cfg.request_timeout_seconds = parse_int(key, value, 1);
            else if (key == "max_retries") cfg.max_retries = parse_int(key, value, 0);
            else if (key == "request_delay_ms") cfg.request_delay_ms = parse_int(key, value, 0);
        }
        else if (current_section == "logging") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = value;
        }
    }

    return cfg;
}

void ConfigLoader::apply_environment(Config& cfg, const EnvLookup& env) {
    auto str = [&](const char* name, std::string& out) {
        if (auto v = env(name)) out = *v;
    };
    auto flag = [&](const char* name, bool& out) {
        if (auto v = env(name)) out = parse_bool(*v);
    };
    auto num = [&](const char* name, int& out, int min_value) {
        if (auto v = env(name)) out = parse_int(name, *v, min_value);
    };

    if (auto v = env("MUSIC_PATH")) cfg.music_paths = parse_paths(*v);
    num("SCAN_INTERVAL_DAYS", cfg.scan_interval_days, 0);
    flag("USE_FOLDER_STRUCTURE", cfg.use_folder_structure);
    str("DEFAULT_ARTIST", cfg.default_artist);

    flag("DOWNLOAD_LYRICS", cfg.download_lyrics);
    flag("DOWNLOAD_COVER", cfg.download_cover);
    flag("OVERWRITE_LYRICS", cfg.overwrite_lyrics);
    flag("OVERWRITE_COVER", cfg.overwrite_cover);

    flag("UPDATE_LYRICS", cfg.update_lyrics);
    flag("UPDATE_COVER", cfg.update_cover);
    flag("UPDATE_BASIC_INFO", cfg.update_basic_info);

    if (auto v = env("API_PROVIDER")) cfg.provider = parse_provider(*v);
    if (auto v = env("API_BASE_URL")) cfg.api_base_url = strip_trailing_slash(*v);
    if (auto v = env("PLATFORMS")) cfg.platforms = parse_list(*v);
    if (auto v = env("LRCAPI_URL")) cfg.lrcapi_url = strip_trailing_slash(*v);
    str("LRCAPI_AUTH", cfg.lrcapi_auth);

    num("WORKERS", cfg.workers, 1);
    num("REQUEST_TIMEOUT_SECONDS", cfg.request_timeout_seconds, 1);
    num("MAX_RETRIES", cfg.max_retries, 0);
    num("REQUEST_DELAY_MS", cfg.request_delay_ms, 0);

    str("LOG_LEVEL", cfg.log_level);
    str("LOG_FILE", cfg.log_file);
}

void ConfigLoader::validate(const Config& cfg) {
    if (cfg.music_paths.empty()) {
        throw ConfigError("No music path configured (MUSIC_PATH)");
    }
    for (const auto& root : cfg.music_paths) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw ConfigError("Music path does not exist or is not a directory: " + root.string());
        }
    }
    if (cfg.scan_interval_days > MAX_SCAN_INTERVAL_DAYS) {
        throw ConfigError("SCAN_INTERVAL_DAYS must be at most " + std::to_string(MAX_SCAN_INTERVAL_DAYS) +
                          ", got " + std::to_string(cfg.scan_interval_days));
    }
    const std::string& base = cfg.provider == ProviderKind::TuneHub ? cfg.api_base_url : cfg.lrcapi_url;
    if (base.empty()) {
        throw ConfigError(std::string("No endpoint configured for provider ") + provider_name(cfg.provider));
    }
}

ConfigLoader::EnvLookup ConfigLoader::process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

const char* ConfigLoader::provider_name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::TuneHub: return "tunehub";
        case ProviderKind::LrcApi: return "lrcapi";
    }
    return "unknown";
}

bool ConfigLoader::parse_bool(const std::string& value) {
    return to_lower(trim(value)) == "true";
}

int ConfigLoader::parse_int(const std::string& key, const std::string& value, int min_value) {
    int parsed = 0;
    try {
        size_t consumed = 0;
        parsed = std::stoi(trim(value), &consumed);
        if (consumed != trim(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (parsed < min_value) {
        throw ConfigError(key + " must be >= " + std::to_string(min_value) + ", got " + value);
    }
    return parsed;
}

ProviderKind ConfigLoader::parse_provider(const std::string& value) {
    std::string name = to_lower(trim(value));
    if (name == "tunehub") return ProviderKind::TuneHub;
    if (name == "lrcapi") return ProviderKind::LrcApi;
    throw ConfigError("Unknown API_PROVIDER '" + value + "' (expected tunehub or lrcapi)");
}

std::vector<std::filesystem::path> ConfigLoader::parse_paths(const std::string& value) {
    std::vector<std::filesystem::path> paths;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(':', start);
        if (end == std::string::npos) end = value.size();
        std::string part = trim(value.substr(start, end - start));
        if (!part.empty()) paths.emplace_back(part);
        start = end + 1;
    }
    return paths;
}

std::vector<std::string> ConfigLoader::parse_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) end = value.size();
        std::string part = trim(value.substr(start, end - start));
        if (!part.empty()) items.push_back(part);
        start = end + 1;
    }
    return items;
}

std::string ConfigLoader::strip_trailing_slash(std::string url) {
    url = trim(url);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace lyricflow::backend
