#include "tabula/net/backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace tabula::net {

BackoffPolicy::BackoffPolicy(const BackoffConfig& config)
    : config_{config}
{
    if (config_.max_tries == 0U) {
        throw std::invalid_argument{"BackoffConfig::max_tries must be positive"};
    }
    if (config_.initial_delay.count() < 0 || config_.max_delay.count() < 0) {
        throw std::invalid_argument{"BackoffConfig delays must not be negative"};
    }
    if (config_.multiplier < 1.0) {
        throw std::invalid_argument{"BackoffConfig::multiplier must be at least 1.0"};
    }
}

std::size_t BackoffPolicy::max_tries() const noexcept
{
    return config_.max_tries;
}

std::chrono::milliseconds BackoffPolicy::delay_for(std::size_t attempt) const noexcept
{
    const auto ceiling = static_cast<double>(config_.max_delay.count());
    auto delay = static_cast<double>(config_.initial_delay.count());
    for (std::size_t step = 0U; step < attempt && delay < ceiling; ++step) {
        delay *= config_.multiplier;
    }
    delay = std::min(delay, ceiling);
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(delay)};
}

}  // namespace tabula::net
