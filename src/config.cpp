#include "config.hpp"

#include "errors.hpp"
#include "region_filter.hpp"
#include "url_utils.hpp"

#include <cstdlib>
#include <sstream>

const char* const kDefaultUserAgent =
    "dirmirror/1.0 (directory listing mirror; set --user-agent to identify yourself)";

namespace {
void trim(std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { s.clear(); return; }
    s = s.substr(a, b - a + 1);
}

int parse_int(const std::string& name, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (used != value.size()) throw ConfigError(name + " must be an integer, got '" + value + "'");
    return v;
}

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos != std::string::npos) {
        size_t comma = list.find(',', pos);
        std::string token = (comma == std::string::npos) ? list.substr(pos) : list.substr(pos, comma - pos);
        trim(token);
        if (!token.empty()) out.push_back(token);
        pos = (comma == std::string::npos) ? std::string::npos : comma + 1;
    }
    return out;
}
} // namespace

// -------------------- environment --------------------
std::unordered_map<std::string, std::string> parse_dotenv(const std::string& text) {
    std::unordered_map<std::string, std::string> vars;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (starts_with(line, "export ")) line = line.substr(7);
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) vars[key] = value;
    }
    return vars;
}

EnvLookup make_env_lookup(std::unordered_map<std::string, std::string> dotenv) {
    return [dotenv = std::move(dotenv)](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str())) return std::string(v);
        auto it = dotenv.find(name);
        if (it != dotenv.end()) return it->second;
        return std::nullopt;
    };
}

Config load_config(const EnvLookup& env) {
    Config cfg;
    if (auto v = env("BASE_URL")) cfg.base_url = *v;
    if (auto v = env("DOWNLOAD_DIR")) cfg.download_dir = *v;
    if (auto v = env("MAX_THREADS")) cfg.max_threads = parse_int("MAX_THREADS", *v);
    if (auto v = env("TIMEOUT")) cfg.timeout_seconds = parse_int("TIMEOUT", *v);
    if (auto v = env("DB_FILE"); v && !v->empty()) cfg.db_file = *v;
    if (auto v = env("USER_AGENT"); v && !v->empty()) cfg.user_agent = *v;
    if (auto v = env("MANIFEST_FILE")) cfg.manifest_file = *v;
    return cfg;
}

// -------------------- command line --------------------
void apply_args(Config& cfg, const std::vector<std::string>& args, const EnvLookup& env) {
    std::optional<std::vector<std::string>> cliRegions;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inlineValue;
        if (starts_with(flag, "--")) {
            auto eq = flag.find('=');
            if (eq != std::string::npos) {
                inlineValue = flag.substr(eq + 1);
                flag = flag.substr(0, eq);
            }
        }
        auto value = [&]() -> std::string {
            if (inlineValue) return *inlineValue;
            if (i + 1 >= args.size()) throw ConfigError(flag + " requires a value");
            return args[++i];
        };

        if (flag == "-h" || flag == "--help") {
            cfg.show_help = true;
        } else if (flag == "-c" || flag == "--count") {
            cfg.count_only = true;
        } else if (flag == "-u" || flag == "--url") {
            cfg.base_url = value();
        } else if (flag == "-d" || flag == "--download-dir") {
            cfg.download_dir = value();
        } else if (flag == "-t" || flag == "--threads") {
            cfg.max_threads = parse_int(flag, value());
        } else if (flag == "--timeout") {
            cfg.timeout_seconds = parse_int(flag, value());
        } else if (flag == "--db-file") {
            cfg.db_file = value();
        } else if (flag == "--user-agent") {
            cfg.user_agent = value();
        } else if (flag == "-m" || flag == "--manifest") {
            cfg.manifest_file = value();
        } else if (flag == "-r" || flag == "--region") {
            if (!cliRegions) cliRegions.emplace();
            if (inlineValue) {
                for (auto& r : split_list(*inlineValue)) cliRegions->push_back(r);
                continue;
            }
            while (i + 1 < args.size() && !starts_with(args[i + 1], "-")) {
                cliRegions->push_back(args[++i]);
            }
        } else {
            throw ConfigError("unknown argument '" + args[i] + "'");
        }
    }

    std::vector<std::string> raw;
    if (cliRegions) {
        raw = *cliRegions;
    } else if (auto v = env("REGION")) {
        raw = split_list(*v);
    }
    cfg.regions = resolve_region_aliases(raw);
}

void validate(Config& cfg) {
    if (cfg.base_url.empty()) {
        throw ConfigError("No base URL specified. Use -u/--url or set BASE_URL in .env");
    }
    if (cfg.download_dir.empty()) {
        throw ConfigError("No download directory specified. Use -d/--download-dir or set DOWNLOAD_DIR in .env");
    }
    if (!parse_url(cfg.base_url)) throw ConfigError("Invalid base URL '" + cfg.base_url + "'");
    if (cfg.max_threads < 1) throw ConfigError("thread count must be at least 1");
    if (cfg.timeout_seconds < 1) throw ConfigError("timeout must be at least 1 second");
    cfg.base_url = ensure_trailing_slash(cfg.base_url);
}

Config build_config(const std::vector<std::string>& args, const EnvLookup& env) {
    Config cfg = load_config(env);
    apply_args(cfg, args, env);
    if (!cfg.show_help) validate(cfg);
    return cfg;
}

std::string usage() {
    return
        "Usage: dirmirror [options]\n"
        "  -u, --url URL            root of the directory listing to mirror (BASE_URL)\n"
        "  -d, --download-dir DIR   local directory to mirror into (DOWNLOAD_DIR)\n"
        "  -t, --threads N          concurrent downloads, default 8 (MAX_THREADS)\n"
        "      --timeout SECONDS    request timeout, default 20 (TIMEOUT)\n"
        "      --db-file PATH       download ledger, default downloads.db (DB_FILE)\n"
        "      --user-agent UA      HTTP User-Agent (USER_AGENT)\n"
        "  -r, --region R [R ...]   keep files whose region tag contains R;\n"
        "                           EU, JP, ... aliases accepted (REGION, comma-separated)\n"
        "  -m, --manifest PATH      write a JSON report of this run (MANIFEST_FILE)\n"
        "  -c, --count              print the number of matching files and exit\n"
        "  -h, --help               show this help\n";
}
