#pragma once

#include "tabula/client_config.hpp"

#include <chrono>
#include <cstddef>

namespace tabula::net {

class BackoffPolicy final {
public:
    explicit BackoffPolicy(const BackoffConfig& config);

    [[nodiscard]] std::size_t max_tries() const noexcept;

    // Delay to wait after the given zero-based failed attempt.
    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) const noexcept;

private:
    BackoffConfig config_{};
};

}  // namespace tabula::net
