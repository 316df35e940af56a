#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

extern const char* const kDefaultUserAgent;

// Run settings. Each field is taken from the command line, else the
// environment, else a .env file in the working directory, else the
// default below.
struct Config {
    std::string base_url;
    std::string download_dir;
    int max_threads = 8;
    int timeout_seconds = 20;
    std::string db_file = "downloads.db";
    std::string user_agent = kDefaultUserAgent;
    std::vector<std::string> regions;  // alias-resolved
    std::string manifest_file;
    bool count_only = false;
    bool show_help = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// KEY=VALUE lines; '#' comments, blank lines and an optional "export "
// prefix are ignored, surrounding quotes stripped.
std::unordered_map<std::string, std::string> parse_dotenv(const std::string& text);

// Reads the process environment, falling back to `dotenv` entries.
EnvLookup make_env_lookup(std::unordered_map<std::string, std::string> dotenv);

// Defaults overlaid with environment values.
Config load_config(const EnvLookup& env);

// Overlays command-line flags (argv without the program name). The region
// list falls back to the REGION variable when -r is not given.
void apply_args(Config& cfg, const std::vector<std::string>& args, const EnvLookup& env);

// Throws ConfigError when a required field is missing or a number is out of
// range; normalizes base_url to end with '/'.
void validate(Config& cfg);

Config build_config(const std::vector<std::string>& args, const EnvLookup& env);

std::string usage();
