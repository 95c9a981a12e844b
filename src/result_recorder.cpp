/*
 * Chaos Load - Result Recorder
 *
 * Streams per-request outcomes to CSV, in the column order
 * timestamp_ms,vu,iteration,status,duration_ms,error
 */

#include "result_recorder.hpp"
#include "run_config.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>

namespace {

// Quote a CSV field if it contains a separator, quote or line break
std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;

    std::string out;
    out.reserve(s.size() + 8);
    out += '"';
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

ResultRecorder::ResultRecorder(const std::string& path) {
    file.open(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw ConfigError("could not open output file for writing: " + path);
    }
    file << csv_header() << "\n";
}

const char* ResultRecorder::csv_header() {
    return "timestamp_ms,vu,iteration,status,duration_ms,error";
}

std::string ResultRecorder::to_csv_row(const RequestOutcome& o) {
    std::ostringstream ss;
    ss << o.started_at << ","
       << o.vu << ","
       << o.iteration << ","
       << o.status << ","
       << std::fixed << std::setprecision(3) << o.duration_ms << ","
       << csv_escape(o.error);
    return ss.str();
}

void ResultRecorder::record(const RequestOutcome& outcome) {
    total_requests += 1;
    if (outcome.failed()) {
        total_failures += 1;
    }

    if (!file.is_open()) return;

    std::string row = to_csv_row(outcome);
    std::lock_guard<std::mutex> lock(file_mutex);
    if (file.fail()) return;
    file << row << "\n";
    if (file.fail()) {
        std::cerr << "\nWarning: Failed to write request outcome, further rows are dropped" << std::endl;
    }
}
