#include "ai/retry_policy.hpp"
#include <algorithm>
#include <cmath>
#include "ai/error.hpp"

namespace kata {
using namespace std;

retry_policy::retry_policy(const retry_config &config) : retry_policy(config, random_device{}()) {}

retry_policy::retry_policy(const retry_config &config, unsigned seed) : cfg(config), rng(seed) {}

bool retry_policy::should_retry(const ai_service_error &error, int attempt) const {
    if (error.cancelled || !error.retryable) return false;
    return attempt + 1 < cfg.max_attempts;
}

chrono::milliseconds retry_policy::next_delay(int attempt) {
    double jitter;
    {
        lock_guard<mutex> guard(rng_mutex);
        jitter = uniform_real_distribution<double>(0, cfg.jitter_ratio)(rng);
    }
    double delay = cfg.base_delay.count() * pow(2.0, attempt) * (1 + jitter);
    double capped = min(delay, static_cast<double>(cfg.max_delay.count()));
    return chrono::milliseconds(static_cast<int64_t>(capped));
}

const retry_config &retry_policy::config() const noexcept {
    return cfg;
}

}  // namespace kata
