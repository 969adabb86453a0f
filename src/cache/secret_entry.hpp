#pragma once

#include "cache/lru_cache.hpp"
#include "cache/refreshable_entry.hpp"
#include "cache/secret_version_entry.hpp"

namespace secretcache {

/**
 * Cache entry for one secret id
 *
 * Holds the DescribeSecret metadata, refreshed on a jittered interval, and
 * a small LRU of version entries. A stage request is answered by finding the
 * version id carrying that stage label and delegating to its version entry.
 */
class SecretEntry : public RefreshableEntry<SecretMetadata, SecretValue> {
public:
    static constexpr size_t MAX_CACHED_VERSIONS = 10;

    SecretEntry(std::shared_ptr<const CacheConfig> config,
                std::shared_ptr<SecretsBackend> backend,
                std::string secret_id);

    /**
     * Version id carrying a stage label
     * @return First matching version id (map order), std::nullopt if none
     */
    static std::optional<std::string> find_version_id(const SecretMetadata& metadata,
                                                      const std::string& version_stage);

    Clock::time_point next_refresh_time() const;

    /**
     * Number of version entries currently cached
     */
    size_t cached_version_count() const { return versions_.size(); }

protected:
    bool is_refresh_needed(Clock::time_point now) const override;

    SecretMetadata execute_refresh() override;

    std::optional<SecretValue> resolve(const std::string& version_stage) override;

    const char* entry_kind() const override { return "secret"; }

private:
    LRUCache<std::string, std::shared_ptr<SecretVersionEntry>> versions_;
    Clock::time_point next_refresh_time_;
};

} // namespace secretcache
