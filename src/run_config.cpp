/*
 * Chaos Load - Run Configuration
 */

#include "run_config.hpp"
#include "chaos_spec.hpp"
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace {

const int DEFAULT_USERS = 150;
const char* DEFAULT_DURATION = "3m";
const char* DEFAULT_GRACE = "30s";

// Half the steady_clock range, so now() + duration cannot overflow
const double MAX_DURATION_MS = static_cast<double>(
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::duration::max()).count()) / 2.0;

bool is_blank(const char* s) {
    while (*s != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*s))) return false;
        ++s;
    }
    return true;
}

// Millisecond multiplier for a unit at text[pos], advancing pos past it.
// Returns 0 for an unknown unit.
double read_unit(const std::string& text, size_t& pos) {
    if (text.compare(pos, 2, "ms") == 0) { pos += 2; return 1.0; }
    if (pos >= text.size()) return 0.0;
    switch (text[pos]) {
        case 's': ++pos; return 1000.0;
        case 'm': ++pos; return 60.0 * 1000.0;
        case 'h': ++pos; return 60.0 * 60.0 * 1000.0;
        default:  return 0.0;
    }
}

} // anonymous namespace

namespace RunConfigLoader {

EnvLookup process_env() {
    return [](const std::string& key) -> std::string {
        const char* val = std::getenv(key.c_str());
        return val != nullptr ? std::string(val) : std::string();
    };
}

std::chrono::milliseconds parse_duration(const std::string& text, bool allow_zero) {
    if (text.empty()) {
        throw ConfigError("empty duration");
    }

    double total_ms = 0.0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        bool digits = false;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            if (text[pos] != '.') digits = true;
            ++pos;
        }
        if (!digits) {
            throw ConfigError("malformed duration '" + text + "'");
        }
        std::string token = text.substr(start, pos - start);
        char* end;
        double value = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size()) {
            throw ConfigError("malformed duration '" + text + "'");
        }

        double unit = read_unit(text, pos);
        if (unit == 0.0) {
            throw ConfigError("duration '" + text + "' needs a unit (ms, s, m or h)");
        }
        total_ms += value * unit;
        if (!(total_ms <= MAX_DURATION_MS)) {
            throw ConfigError("duration '" + text + "' is too long");
        }
    }

    auto result = std::chrono::milliseconds(static_cast<long long>(std::llround(total_ms)));
    if (result.count() == 0 && !allow_zero) {
        throw ConfigError("duration '" + text + "' must be greater than zero");
    }
    return result;
}

int parse_users(const std::string& text) {
    if (text.empty()) return DEFAULT_USERS;

    char* end;
    double val = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || !is_blank(end) || std::isnan(val)) {
        std::cerr << "Warning: USERS='" << text << "' is not a number, using "
                  << DEFAULT_USERS << std::endl;
        return DEFAULT_USERS;
    }
    if (val != std::floor(val)) {
        throw ConfigError("virtual-user count must be an integer, got '" + text + "'");
    }
    if (val <= 0 || val > INT_MAX) {
        throw ConfigError("virtual-user count must be a positive integer, got '" + text + "'");
    }
    return static_cast<int>(val);
}

RunConfig load(const EnvLookup& env) {
    RunConfig config;

    config.users = parse_users(env("USERS"));

    std::string dur = env("DUR");
    config.duration_text = dur.empty() ? DEFAULT_DURATION : dur;
    config.duration = parse_duration(config.duration_text);

    std::string grace = env("GRACE");
    config.grace_period = parse_duration(grace.empty() ? DEFAULT_GRACE : grace, true);

    config.url = env("URL");
    if (config.url.empty()) {
        throw ConfigError("URL is required");
    }

    config.chaos = ChaosSpec::assemble(env("CHAOS"), env("LAT"), env("ERR"), env("CPU"));
    config.output_path = env("OUT");
    return config;
}

} // namespace RunConfigLoader
