#include "api/http_client.hpp"
#include <curl/curl.h>
#include <sstream>
#include <utility>

namespace secretcache {

// CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
        curl_global_cleanup();
    }
};

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
{
    // Remove trailing slash from base_url
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::post(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::string url = base_url_ + path;

    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(impl_->curl, CURLOPT_POST, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    struct curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header_line.c_str());
    }
    if (curl_headers) {
        curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    std::string response_body;

    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);

    CURLcode res = curl_easy_perform(impl_->curl);

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }

    if (res != CURLE_OK) {
        std::string error_msg = "CURL error: ";
        error_msg += curl_easy_strerror(res);
        throw HttpClientError(error_msg);
    }

    long status_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &status_code);

    if (status_code >= 400) {
        std::ostringstream oss;
        oss << "HTTP " << status_code << ": " << response_body;
        throw HttpClientError(oss.str(), static_cast<int>(status_code));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(response_body);

    return response;
}

} // namespace secretcache
