/*
 * Chaos Load - Chaos Directive
 */

#include "chaos_spec.hpp"
#include <stdexcept>
#include <vector>
#include <curl/curl.h>

namespace ChaosSpec {

std::string assemble(const std::string& full,
                     const std::string& lat,
                     const std::string& err,
                     const std::string& cpu) {
    if (!full.empty()) return full;

    std::vector<std::string> parts;
    if (!lat.empty()) parts.push_back("lat:" + lat);
    if (!err.empty()) parts.push_back("err:" + err);
    if (!cpu.empty()) parts.push_back("cpu:" + cpu);

    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += ",";
        joined += parts[i];
    }
    return joined;
}

std::string escape(const std::string& s) {
    // libcurl ignores the handle argument for escaping
    char* out = curl_easy_escape(nullptr, s.data(), static_cast<int>(s.size()));
    if (!out) {
        throw std::runtime_error("curl_easy_escape failed");
    }
    std::string result(out);
    curl_free(out);
    return result;
}

std::string unescape(const std::string& s) {
    int len = 0;
    char* out = curl_easy_unescape(nullptr, s.data(), static_cast<int>(s.size()), &len);
    if (!out) {
        throw std::runtime_error("curl_easy_unescape failed");
    }
    std::string result(out, static_cast<size_t>(len));
    curl_free(out);
    return result;
}

std::string build_target(const std::string& base_url, const std::string& chaos) {
    if (chaos.empty()) return base_url;
    return base_url + "?chaos=" + escape(chaos);
}

} // namespace ChaosSpec
