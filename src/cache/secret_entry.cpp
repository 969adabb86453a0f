#include "cache/secret_entry.hpp"
#include <algorithm>

namespace secretcache {

constexpr size_t SecretEntry::MAX_CACHED_VERSIONS;

SecretEntry::SecretEntry(std::shared_ptr<const CacheConfig> config,
                         std::shared_ptr<SecretsBackend> backend,
                         std::string secret_id)
    : RefreshableEntry(std::move(config), std::move(backend), std::move(secret_id))
    , versions_(MAX_CACHED_VERSIONS)
    , next_refresh_time_(Clock::now())
{
}

std::optional<std::string> SecretEntry::find_version_id(const SecretMetadata& metadata,
                                                        const std::string& version_stage) {
    for (const auto& [version_id, stages] : metadata.version_ids_to_stages) {
        if (std::find(stages.begin(), stages.end(), version_stage) != stages.end()) {
            return version_id;
        }
    }
    return std::nullopt;
}

Clock::time_point SecretEntry::next_refresh_time() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return next_refresh_time_;
}

bool SecretEntry::is_refresh_needed(Clock::time_point now) const {
    if (RefreshableEntry::is_refresh_needed(now)) {
        return true;
    }
    // While failing, only the backoff window decides
    if (has_stored_exception()) {
        return false;
    }
    return next_refresh_time_ <= now;
}

SecretMetadata SecretEntry::execute_refresh() {
    SecretMetadata metadata = backend_->describe_secret(secret_id_);
    next_refresh_time_ = deadline_after(Clock::now(),
                                        draw_refresh_delay(config_->secret_refresh_interval));
    return metadata;
}

std::optional<SecretValue> SecretEntry::resolve(const std::string& version_stage) {
    std::optional<SecretMetadata> metadata = load_result();
    if (!metadata) {
        return std::nullopt;
    }

    std::optional<std::string> version_id = find_version_id(*metadata, version_stage);
    if (!version_id) {
        Logger::get_instance().log_debug("Version stage not found", {
            {"event", "stage_unresolved"},
            {"secret_id", secret_id_},
            {"version_stage", version_stage}
        });
        return std::nullopt;
    }

    std::shared_ptr<SecretVersionEntry> version = versions_.get_or_put(*version_id, [&]() {
        return std::make_shared<SecretVersionEntry>(config_, backend_, secret_id_, *version_id);
    });

    return version->get_value(version_stage);
}

} // namespace secretcache
