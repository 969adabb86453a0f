#pragma once

#include "api/secrets_backend.hpp"
#include "cache/secret_cache_hook.hpp"
#include "config/cache_config.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace secretcache {

using Clock = std::chrono::steady_clock;

/**
 * Backoff delay after exception_count consecutive failures
 *
 * min(base * growth^exception_count, max)
 */
std::chrono::milliseconds compute_retry_delay(const CacheConfig& config, size_t exception_count);

/**
 * now + delay, saturating at Clock::time_point::max()
 */
Clock::time_point deadline_after(Clock::time_point now, std::chrono::milliseconds delay);

/**
 * Random metadata refresh delay, uniform in [interval / 2, interval]
 */
std::chrono::milliseconds draw_refresh_delay(std::chrono::seconds interval);

/**
 * Cached object with refresh-if-needed / serve-stale semantics
 *
 * Features:
 * - Refresh happens lazily inside get_value(), at most one at a time
 * - Failed refreshes keep the previous result and schedule an exponential
 *   backoff retry
 * - The last failure is rethrown only when nothing can be served
 * - Values are returned by copy; callers never share cached state
 * - One reentrant lock per entry
 *
 * Subclasses supply the fetch (execute_refresh), the way a stored result
 * answers a stage request (resolve) and may extend the staleness test.
 *
 * @tparam Result Object fetched from the backend and stored
 * @tparam Value Object handed out to callers
 */
template <typename Result, typename Value>
class RefreshableEntry {
public:
    RefreshableEntry(std::shared_ptr<const CacheConfig> config,
                     std::shared_ptr<SecretsBackend> backend,
                     std::string secret_id)
        : config_(std::move(config))
        , backend_(std::move(backend))
        , secret_id_(std::move(secret_id))
        , exception_count_(0)
        , refresh_needed_(true)
    {
    }

    virtual ~RefreshableEntry() = default;

    RefreshableEntry(const RefreshableEntry&) = delete;
    RefreshableEntry& operator=(const RefreshableEntry&) = delete;

    /**
     * Get the cached value for a version stage, refreshing first if due
     * @param version_stage Requested stage (empty: configured default)
     * @return Copy of the value, std::nullopt if the stage does not resolve
     * @throws the last backend failure if nothing resolves and a refresh failed
     */
    std::optional<Value> get_value(const std::string& version_stage = "") {
        const std::string& stage =
            version_stage.empty() ? config_->default_version_stage : version_stage;

        std::lock_guard<std::recursive_mutex> lock(mutex_);

        refresh();

        std::optional<Value> value = resolve(stage);
        if (!value && exception_) {
            std::rethrow_exception(exception_);
        }
        return value;
    }

    /**
     * Force a refresh attempt on the next get_value(), ignoring timers
     */
    void refresh_now() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        refresh_needed_ = true;
    }

    const std::string& secret_id() const { return secret_id_; }

    size_t exception_count() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return exception_count_;
    }

    bool has_exception() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return static_cast<bool>(exception_);
    }

    std::optional<Clock::time_point> next_retry_time() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return next_retry_time_;
    }

protected:
    /**
     * Whether get_value() must refresh before resolving. Caller holds mutex_.
     */
    virtual bool is_refresh_needed(Clock::time_point now) const {
        if (refresh_needed_) {
            return true;
        }
        if (!exception_ || !next_retry_time_) {
            return false;
        }
        return *next_retry_time_ <= now;
    }

    /**
     * Fetch a fresh result from the backend. Caller holds mutex_.
     * @throws any exception on failure
     */
    virtual Result execute_refresh() = 0;

    /**
     * Answer a stage request from the stored result. Caller holds mutex_.
     */
    virtual std::optional<Value> resolve(const std::string& version_stage) = 0;

    /**
     * "secret" or "version", for log events
     */
    virtual const char* entry_kind() const = 0;

    virtual std::string log_version_id() const { return ""; }

    /**
     * Stored result with the hook's load transform applied
     */
    std::optional<Result> load_result() const {
        if (!result_) {
            return std::nullopt;
        }
        if (config_->secret_cache_hook) {
            return config_->secret_cache_hook->get(*result_);
        }
        return result_;
    }

    bool has_stored_exception() const { return static_cast<bool>(exception_); }

    std::shared_ptr<const CacheConfig> config_;
    std::shared_ptr<SecretsBackend> backend_;
    const std::string secret_id_;
    mutable std::recursive_mutex mutex_;

private:
    std::optional<Result> result_;
    std::exception_ptr exception_;
    size_t exception_count_;
    bool refresh_needed_;
    std::optional<Clock::time_point> next_retry_time_;

    void refresh() {
        if (!is_refresh_needed(Clock::now())) {
            return;
        }
        refresh_needed_ = false;

        try {
            store_result(execute_refresh());
            exception_ = nullptr;
            exception_count_ = 0;
            next_retry_time_.reset();

            Logger::get_instance().log_refresh(entry_kind(), secret_id_, log_version_id());

        } catch (const std::exception& e) {
            record_failure(std::current_exception(), e.what());
        } catch (...) {
            record_failure(std::current_exception(), "unknown error");
        }
    }

    void store_result(Result result) {
        if (config_->secret_cache_hook) {
            result_ = config_->secret_cache_hook->put(std::move(result));
        } else {
            result_ = std::move(result);
        }
    }

    void record_failure(std::exception_ptr error, const std::string& message) {
        exception_ = error;
        std::chrono::milliseconds delay = compute_retry_delay(*config_, exception_count_);
        exception_count_++;
        next_retry_time_ = deadline_after(Clock::now(), delay);

        Logger::get_instance().log_refresh_failed(
            entry_kind(), secret_id_, log_version_id(), message, exception_count_, delay);
    }
};

} // namespace secretcache
