#include "cache/secret_version_entry.hpp"

namespace secretcache {

SecretVersionEntry::SecretVersionEntry(std::shared_ptr<const CacheConfig> config,
                                       std::shared_ptr<SecretsBackend> backend,
                                       std::string secret_id,
                                       std::string version_id)
    : RefreshableEntry(std::move(config), std::move(backend), std::move(secret_id))
    , version_id_(std::move(version_id))
{
}

SecretValue SecretVersionEntry::execute_refresh() {
    return backend_->get_secret_value(secret_id_, version_id_);
}

std::optional<SecretValue> SecretVersionEntry::resolve(const std::string& /*version_stage*/) {
    return load_result();
}

} // namespace secretcache
