#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lyricflow::backend {

enum class ProviderKind {
    TuneHub,
    LrcApi,
};

// Longest sleep between passes; keeps the interval wait within the steady clock range
constexpr int MAX_SCAN_INTERVAL_DAYS = 3650;

struct Config {
    // Library
    std::vector<std::filesystem::path> music_paths{"/music"};
    int scan_interval_days = 0;  // 0 = single pass
    bool use_folder_structure = true;
    std::string default_artist;

    // Sidecar files
    bool download_lyrics = true;
    bool download_cover = true;
    bool overwrite_lyrics = false;
    bool overwrite_cover = false;

    // Embedded tags
    bool update_lyrics = false;
    bool update_cover = false;
    bool update_basic_info = false;

    // Provider
    ProviderKind provider = ProviderKind::TuneHub;
    std::string api_base_url = "https://music-dl.sayqz.com";
    std::vector<std::string> platforms{"netease", "kuwo", "qq"};
    std::string lrcapi_url = "https://api.lrc.cx";
    std::string lrcapi_auth;

    // Network and scheduling
    int workers = 4;
    int request_timeout_seconds = 30;
    int max_retries = 2;
    int request_delay_ms = 200;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigLoader {
public:
    // Returns the value of an environment variable, nullopt when unset
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // Defaults, then LYRICFLOW_CONFIG file, then environment; validated.
    // Throws ConfigError on fatal problems.
    static Config load();
    static Config load(const EnvLookup& env);

    static Config load_from_file(const std::filesystem::path& path, Config base = Config{});
    static void apply_environment(Config& cfg, const EnvLookup& env);
    static void validate(const Config& cfg);

    static EnvLookup process_environment();
    static const char* provider_name(ProviderKind kind);

private:
    static bool parse_bool(const std::string& value);
    static int parse_int(const std::string& key, const std::string& value, int min_value);
    static ProviderKind parse_provider(const std::string& value);
    static std::vector<std::filesystem::path> parse_paths(const std::string& value);
    static std::vector<std::string> parse_list(const std::string& value);
    static std::string strip_trailing_slash(std::string url);
};

}  // namespace lyricflow::backend
