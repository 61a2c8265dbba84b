/**
 * @file http_client.cpp
 * @brief CurlHttpClient implementation on the libcurl easy interface.
 * @author Dimitris Kafetzis
 */

#include "network/http_client.hpp"

#include <curl/curl.h>

#include <memory>

namespace beaconfig {

namespace {

/**
 * @brief Process-wide libcurl initialisation, done once on first use.
 */
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

/// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

}  // anonymous namespace

CurlHttpClient::CurlHttpClient(HttpConfig config)
    : config_(std::move(config)) {
    ensure_curl_global();
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url,
                                         uint32_t timeout_ms,
                                         std::stop_token stop) {
    return perform(url, nullptr, timeout_ms, std::move(stop));
}

Result<HttpResponse> CurlHttpClient::post_json(const std::string& url,
                                               const std::string& json_body,
                                               uint32_t timeout_ms,
                                               std::stop_token stop) {
    return perform(url, &json_body, timeout_ms, std::move(stop));
}

Result<HttpResponse> CurlHttpClient::perform(const std::string& url,
                                             const std::string* json_body,
                                             uint32_t timeout_ms,
                                             std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::Cancelled, "Request to " + url + " cancelled"};
    }

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Error{ErrorCode::Transport, "Failed to initialize CURL"};
    }

    HttpResponse response;
    HeaderList headers(nullptr, &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, config_.verify_peer ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, config_.verify_peer ? 2L : 0L);
    if (!config_.ca_file.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, config_.ca_file.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);

    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));
    if (json_body != nullptr) {
        headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return Error{ErrorCode::Cancelled, "Request to " + url + " cancelled"};
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return Error{ErrorCode::Timeout, "Request to " + url + " timed out after "
                     + std::to_string(timeout_ms) + "ms"};
    }
    if (rc != CURLE_OK) {
        return Error{ErrorCode::Transport, "Request to " + url + " failed: "
                     + std::string(curl_easy_strerror(rc))};
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace beaconfig
