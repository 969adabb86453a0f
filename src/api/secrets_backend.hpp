#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace secretcache {

/**
 * Raw bytes of a binary secret payload
 */
using SecretBinary = std::vector<uint8_t>;

/**
 * Version/stage metadata of one secret (result of DescribeSecret)
 */
struct SecretMetadata {
    std::string name;
    // Version id -> stage labels attached to it (e.g. "AWSCURRENT")
    std::map<std::string, std::vector<std::string>> version_ids_to_stages;
};

/**
 * Payload of one immutable secret version (result of GetSecretValue)
 */
struct SecretValue {
    std::string name;
    std::string version_id;
    std::vector<std::string> version_stages;
    std::optional<std::string> secret_string;
    std::optional<SecretBinary> secret_binary;
};

/**
 * Backend error
 */
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Secrets backend interface
 *
 * The cache only ever needs these two calls. Implementations must be safe
 * for concurrent invocation; the cache shares one instance across all
 * entries and threads.
 */
class SecretsBackend {
public:
    virtual ~SecretsBackend() = default;

    /**
     * Describe a secret
     * @param secret_id Secret name or ARN
     * @return Version/stage metadata (empty map if no versions)
     * @throws any exception on failure
     */
    virtual SecretMetadata describe_secret(const std::string& secret_id) = 0;

    /**
     * Fetch one secret version
     * @param secret_id Secret name or ARN
     * @param version_id Version identifier
     * @return Version payload (either field may be absent)
     * @throws any exception on failure
     */
    virtual SecretValue get_secret_value(const std::string& secret_id,
                                         const std::string& version_id) = 0;
};

} // namespace secretcache
