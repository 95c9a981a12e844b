/*
 * Chaos Load - Result Recorder
 *
 * Receives every virtual user's request outcome. Optionally streams them to a
 * CSV file, one row per request. Counters exist only for the progress line.
 */

#pragma once

#include "request_outcome.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

class ResultRecorder {
public:
    ResultRecorder() = default;

    // Opens path and writes the CSV header. Throws ConfigError if the file
    // cannot be opened.
    explicit ResultRecorder(const std::string& path);

    // Thread-safe
    void record(const RequestOutcome& outcome);

    long long requests() const { return total_requests.load(); }
    long long failures() const { return total_failures.load(); }

    // Formats one CSV row (without trailing newline)
    static std::string to_csv_row(const RequestOutcome& outcome);
    static const char* csv_header();

private:
    std::atomic<long long> total_requests{0};
    std::atomic<long long> total_failures{0};

    std::ofstream file;
    std::mutex file_mutex;
};
