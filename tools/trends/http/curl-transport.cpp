#include "http-transport.h"
#include "../common/errors.h"
#include "../common/trends-common.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct curl_deleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

http_response curl_transport::post_json(const std::string& url,
                                        const std::map<std::string, std::string>& headers,
                                        const std::string& body,
                                        int timeout_ms) {
    std::unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
    if (!curl) {
        throw trends::upstream_unavailable(trends::format_error("HTTP POST", "curl_easy_init returned null", url));
    }

    curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& [name, value] : headers) {
        raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
    }
    std::unique_ptr<curl_slist, slist_deleter> header_list(raw_headers);

    http_response response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw trends::upstream_unavailable(
            trends::format_error("HTTP POST", curl_easy_strerror(res), url));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("POST {} -> {} ({} bytes)", url, response.status, response.body.size());

    return response;
}
