#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "pipeline.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

std::string read_dotenv() {
    std::ifstream ifs(".env");
    if (!ifs) return {};
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}
} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Config config;
    try {
        config = build_config(args, make_env_lookup(parse_dotenv(read_dotenv())));
    } catch (const ConfigError& ex) {
        log_error(ex.what());
        std::cerr << usage();
        return 1;
    }
    if (config.show_help) {
        std::cout << usage();
        return 0;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        CprHttpClient client(config.user_agent,
                             std::chrono::seconds(config.timeout_seconds),
                             static_cast<size_t>(config.max_threads));
        Pipeline pipeline(config, client, g_stop);
        return pipeline.run(std::cout);
    } catch (const std::exception& ex) {
        log_error(ex.what());
        return 1;
    }
}
