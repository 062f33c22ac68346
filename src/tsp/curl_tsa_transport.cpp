/**
 * @file curl_tsa_transport.cpp
 * @brief libcurl TSA transport
 */

#include "pdftrust/tsp/curl_tsa_transport.h"

#include <mutex>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace pdftrust::tsp {

namespace {

std::once_flag g_curlInitFlag;

size_t writeCallback(void* contents, size_t size, size_t nmemb, std::vector<uint8_t>* out) {
    size_t totalSize = size * nmemb;
    const auto* bytes = static_cast<const uint8_t*>(contents);
    out->insert(out->end(), bytes, bytes + totalSize);
    return totalSize;
}

} // namespace

CurlTsaTransport::CurlTsaTransport() {
    std::call_once(g_curlInitFlag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("[CurlTsaTransport] curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

TransportResult CurlTsaTransport::post(const TSAConfig& config, const std::vector<uint8_t>& requestDer) {
    TransportResult result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/timestamp-query");
    headers = curl_slist_append(headers, "Accept: application/timestamp-reply");

    curl_easy_setopt(curl, CURLOPT_URL, config.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, requestDer.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(requestDer.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);

    std::string credentials;
    if (!config.username.empty()) {
        credentials = config.username + ":" + config.password;
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERPWD, credentials.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        spdlog::debug("[CurlTsaTransport] POST {} failed: {}", config.url, result.error);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpStatus);
        if (!isSuccessStatus(result.httpStatus)) {
            result.error = "HTTP " + std::to_string(result.httpStatus);
        } else if (result.body.empty()) {
            result.error = "empty response body";
        } else {
            result.success = true;
        }
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace pdftrust::tsp
