/*
 * Chaos Load - libcurl HTTP Client
 */

#include "http_client.hpp"
#include <stdexcept>
#include <curl/curl.h>

namespace {

// Callback to discard response body
size_t discard_callback(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

// Returning non-zero makes libcurl abort with CURLE_ABORTED_BY_CALLBACK
int abort_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* abort = static_cast<const std::atomic<bool>*>(clientp);
    return abort->load() ? 1 : 0;
}

class CurlClient : public HttpClient {
public:
    explicit CurlClient(std::chrono::milliseconds timeout) : timeout_ms(timeout.count()) {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Could not initialize curl handle");
        }
    }

    ~CurlClient() override {
        curl_easy_cleanup(curl);
    }

    CurlClient(const CurlClient&) = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    HttpResponse get(const std::string& url, const std::atomic<bool>& abort) override {
        HttpResponse response;

        // The handle is reused across iterations so keep-alive connections survive
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &abort);

        CURLcode res = curl_easy_perform(curl);

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

        double total_s = 0.0;
        curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_s);
        response.elapsed_ms = total_s * 1000.0;

        if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
        }
        return response;
    }

private:
    CURL* curl = nullptr;
    long timeout_ms;
};

} // anonymous namespace

std::unique_ptr<HttpClient> create_curl_client(std::chrono::milliseconds timeout) {
    return std::make_unique<CurlClient>(timeout);
}
