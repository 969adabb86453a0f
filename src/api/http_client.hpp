#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace secretcache {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code;
    std::string body;
};

/**
 * HTTP client error
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Minimal HTTP client over libcurl
 *
 * Features:
 * - Single attempt per request (retry policy belongs to the cache above)
 * - Configurable timeout (default 30s)
 * - Status >= 400 raised as HttpClientError with the status code
 * - Thread-safe: the curl handle is used under a mutex
 */
class HttpClient {
public:
    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "https://secrets.internal:8443")
     * @param timeout_ms Timeout in milliseconds (default: 30000)
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000);

    ~HttpClient();

    /**
     * POST request
     * @param path Path relative to base_url
     * @param body Request body
     * @param headers Request headers (Content-Type included)
     * @return HttpResponse
     * @throws HttpClientError on transport failure or status >= 400
     */
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    int timeout_ms_;
    std::mutex mutex_;
};

} // namespace secretcache
