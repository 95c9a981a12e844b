/*
 * Chaos Load - Main Entry Point
 *
 * Drives concurrent virtual users against one HTTP endpoint, optionally
 * passing a chaos directive (latency, error rate, CPU load) to the target.
 */

#include "chaos_spec.hpp"
#include "http_client.hpp"
#include "load_driver.hpp"
#include "result_recorder.hpp"
#include "run_config.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <cstring>
#include <curl/curl.h>

void show_help() {
    std::cout << "Chaos Load - HTTP load generator with chaos injection\n\n"
              << "Usage: chaos-load [OPTIONS] [URL]\n\n"
              << "Options:\n"
              << "  -u N        Number of virtual users (env USERS, default: 150)\n"
              << "  -d DUR      Run duration, e.g. 90s, 3m, 1m30s (env DUR, default: 3m)\n"
              << "  -o FILE     Write one CSV row per request to FILE (env OUT)\n"
              << "  -h          Show this help\n\n"
              << "Environment:\n"
              << "  URL         Target base URL (required unless given as argument)\n"
              << "  CHAOS       Full chaos directive, used verbatim\n"
              << "  LAT ERR CPU Chaos components, used only when CHAOS is unset\n"
              << "  GRACE       Time allowed for in-flight requests at the end (default: 30s)\n\n"
              << "Examples:\n"
              << "  URL=http://svc/ping chaos-load -u 10 -d 90s\n"
              << "  LAT=100ms CPU=50 chaos-load http://svc/ping\n"
              << "  CHAOS=lat:2500,err:0.03 chaos-load -o run.csv http://svc/ping\n";
}

int main(int argc, char* argv[]) {
    std::map<std::string, std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            show_help();
            return 0;
        }
        if (strcmp(argv[i], "-u") == 0 && i + 1 < argc) {
            overrides["USERS"] = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            overrides["DUR"] = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            overrides["OUT"] = argv[++i];
            continue;
        }
        // Anything that is not an option is the target URL
        if (argv[i][0] != '-' && overrides.count("URL") == 0) {
            overrides["URL"] = argv[i];
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << std::endl;
        show_help();
        return 1;
    }

    EnvLookup process_env = RunConfigLoader::process_env();
    EnvLookup env = [&](const std::string& key) {
        auto it = overrides.find(key);
        return it != overrides.end() ? it->second : process_env(key);
    };

    RunConfig config;
    std::unique_ptr<ResultRecorder> recorder;
    try {
        config = RunConfigLoader::load(env);
        if (config.output_path.empty()) {
            recorder = std::make_unique<ResultRecorder>();
        } else {
            recorder = std::make_unique<ResultRecorder>(config.output_path);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "╔══════════════════════════════════════════╗" << std::endl;
    std::cout << "║        Chaos Load - Load Generator       ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════╝" << std::endl;
    std::cout << "\nConfiguration:" << std::endl;
    std::cout << "  Target:        " << config.url << std::endl;
    std::cout << "  Virtual users: " << config.users << std::endl;
    std::cout << "  Duration:      " << config.duration_text << std::endl;
    std::cout << "  Chaos:         " << (config.chaos.empty() ? "none" : config.chaos) << std::endl;
    std::cout << "  Request URL:   " << ChaosSpec::build_target(config.url, config.chaos) << std::endl;
    if (!config.output_path.empty()) {
        std::cout << "  Output:        " << config.output_path << std::endl;
    }

    // Must happen before any thread creates a handle
    CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init != CURLE_OK) {
        std::cerr << "\nFatal error: curl_global_init failed: " << curl_easy_strerror(init) << std::endl;
        return 1;
    }

    int rc = 0;
    try {
        auto timeout = config.request_timeout;
        LoadDriver driver([timeout] { return create_curl_client(timeout); }, *recorder);
        driver.run(config);
    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
