/*
 * Chaos Load - HTTP Client Interface
 *
 * One client per virtual user; implementations are not shared between threads.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct HttpResponse {
    long status = 0;        // 0 if no response arrived
    double elapsed_ms = 0.0;
    std::string error;      // empty when the transfer completed
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Issues a GET against url. Transport failures, timeouts and aborts are
    // reported through HttpResponse::error, never thrown.
    // The transfer is cut short once abort becomes true.
    virtual HttpResponse get(const std::string& url, const std::atomic<bool>& abort) = 0;
};

std::unique_ptr<HttpClient> create_curl_client(std::chrono::milliseconds timeout);
