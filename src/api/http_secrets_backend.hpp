#pragma once

#include "api/http_client.hpp"
#include "api/secrets_backend.hpp"
#include "config/cache_config.hpp"
#include <map>
#include <memory>
#include <string>

namespace secretcache {

/**
 * Secrets backend speaking the Secrets Manager JSON protocol over HTTP
 *
 * Each call is one POST to the endpoint root with an X-Amz-Target header:
 * - secretsmanager.DescribeSecret  {"SecretId"}
 * - secretsmanager.GetSecretValue  {"SecretId", "VersionId"}
 *
 * Requests are sent as configured (static headers only, no signing), so the
 * endpoint must accept them as-is: a local agent, a proxy or a test server.
 * No retries: failures go straight to the cache's backoff logic.
 */
class HttpSecretsBackend : public SecretsBackend {
public:
    explicit HttpSecretsBackend(const HttpBackendConfig& config);

    ~HttpSecretsBackend() override;

    SecretMetadata describe_secret(const std::string& secret_id) override;

    SecretValue get_secret_value(const std::string& secret_id,
                                 const std::string& version_id) override;

    /**
     * Parse a DescribeSecret response body
     * @throws BackendError on malformed JSON
     */
    static SecretMetadata parse_describe_response(const std::string& body);

    /**
     * Parse a GetSecretValue response body (SecretBinary is base64)
     * @throws BackendError on malformed JSON or base64
     */
    static SecretValue parse_secret_value_response(const std::string& body);

    /**
     * Decode standard base64 (padding optional, whitespace ignored)
     * @throws BackendError on invalid characters
     */
    static SecretBinary decode_base64(const std::string& encoded);

private:
    std::unique_ptr<HttpClient> http_client_;
    std::map<std::string, std::string> headers_;

    std::string call(const std::string& target, const std::string& body, const std::string& secret_id);
};

} // namespace secretcache
