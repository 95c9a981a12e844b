/*
 * Chaos Load - Run Configuration
 *
 * Resolved once at startup from environment-style key/value pairs and then
 * shared read-only by every virtual user.
 */

#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct RunConfig {
    int users = 150;
    std::string duration_text = "3m";
    std::chrono::milliseconds duration{std::chrono::minutes(3)};
    std::string url;
    std::string chaos;                  // resolved directive, may be empty
    std::string output_path;            // empty = no per-request CSV

    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds pacing_interval{std::chrono::seconds(1)};
    std::chrono::milliseconds grace_period{std::chrono::seconds(30)};
};

// Returns the value for a key, or an empty string when it is unset.
using EnvLookup = std::function<std::string(const std::string&)>;

namespace RunConfigLoader {
    // Lookup backed by std::getenv
    EnvLookup process_env();

    // Resolves USERS, DUR, URL, CHAOS/LAT/ERR/CPU, GRACE and OUT.
    // Throws ConfigError on a missing URL, a non-positive or fractional user
    // count, or a malformed duration.
    RunConfig load(const EnvLookup& env);

    // Parses k6-style durations such as "3m", "90s", "1m30s" or "500ms".
    // Throws ConfigError when the text is malformed, or zero and !allow_zero.
    std::chrono::milliseconds parse_duration(const std::string& text, bool allow_zero = false);

    // Parses a virtual-user count. Non-numeric text falls back to 150 with a
    // warning; fractional, zero or negative values throw ConfigError.
    int parse_users(const std::string& text);
}
