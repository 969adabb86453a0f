#pragma once

#include "cache/refreshable_entry.hpp"

namespace secretcache {

/**
 * Cache entry for one immutable secret version
 *
 * Fetched once with GetSecretValue. There is no refresh timer: after the
 * first success the entry only refreshes when explicitly asked to, and after
 * a failure only once its backoff window has passed.
 */
class SecretVersionEntry : public RefreshableEntry<SecretValue, SecretValue> {
public:
    SecretVersionEntry(std::shared_ptr<const CacheConfig> config,
                       std::shared_ptr<SecretsBackend> backend,
                       std::string secret_id,
                       std::string version_id);

    const std::string& version_id() const { return version_id_; }

protected:
    SecretValue execute_refresh() override;

    // A version entry is pinned to one version; the stage is ignored
    std::optional<SecretValue> resolve(const std::string& version_stage) override;

    const char* entry_kind() const override { return "version"; }

    std::string log_version_id() const override { return version_id_; }

private:
    const std::string version_id_;
};

} // namespace secretcache
