#include "util/curlWrappers.hpp"

#include <mutex>
#include <fmt/format.h>

namespace sw::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (const auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
            throw std::runtime_error(fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
    });
}

std::string HttpResponse::describe() const {
    if (curl != CURLE_OK) {
        if (!error.empty()) return fmt::format("CURL={} ({})", static_cast<int>(curl), error);
        return fmt::format("CURL={} ({})", static_cast<int>(curl), curl_easy_strerror(curl));
    }
    return fmt::format("HTTP {}", http);
}

static long timeoutMs(const Duration timeout) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
}

HttpResponse httpGet(const std::string& url, const Duration timeout) {
    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeoutMs(timeout));
    });
}

HttpResponse httpPostJson(const std::string& url, const std::string& json, const Duration timeout) {
    SList hdrs;
    hdrs.add("Content-Type: application/json");
    hdrs.add("Accept: application/json");

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, json.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(json.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeoutMs(timeout));
    });
}

}
