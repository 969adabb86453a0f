#include "cache/refreshable_entry.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace secretcache {

std::chrono::milliseconds compute_retry_delay(const CacheConfig& config, size_t exception_count) {
    double base_ms = static_cast<double>(config.exception_retry_delay_base.count());
    double max_ms = static_cast<double>(config.exception_retry_delay_max.count());
    if (base_ms <= 0.0) {
        return std::chrono::milliseconds(0);
    }

    // pow() may overflow to inf for long failure streaks; min() caps it
    double delay_ms = base_ms * std::pow(config.exception_retry_growth_factor,
                                         static_cast<double>(exception_count));
    delay_ms = std::min(delay_ms, max_ms);

    // 2^63 is the first double a long long cannot hold
    const double limit = static_cast<double>(std::chrono::milliseconds::max().count());
    if (!(delay_ms < limit)) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

Clock::time_point deadline_after(Clock::time_point now, std::chrono::milliseconds delay) {
    if (delay <= std::chrono::milliseconds::zero()) {
        return now;
    }

    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (delay >= headroom) {
        return Clock::time_point::max();
    }
    return now + std::chrono::duration_cast<Clock::duration>(delay);
}

std::chrono::milliseconds draw_refresh_delay(std::chrono::seconds interval) {
    thread_local std::mt19937_64 generator{std::random_device{}()};

    if (interval <= std::chrono::seconds::zero()) {
        return std::chrono::milliseconds(0);
    }
    const auto max_interval = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds::max());
    interval = std::min(interval, max_interval);

    long long interval_ms = std::chrono::duration_cast<std::chrono::milliseconds>(interval).count();
    std::uniform_int_distribution<long long> distribution(interval_ms / 2, interval_ms);

    return std::chrono::milliseconds(distribution(generator));
}

} // namespace secretcache
