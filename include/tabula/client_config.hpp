#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tabula {

// 90% of the 5 MiB transport message limit; the rest is headroom for request framing.
constexpr std::size_t kDefaultMaxChunkSize = 4'718'592U;

struct ChunkerConfig final {
    std::size_t max_chunk_size = kDefaultMaxChunkSize;
};

struct BackoffConfig final {
    std::size_t max_tries = 10U;
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{10'000};
    double multiplier = 2.0;
};

struct ClientConfig final {
    std::vector<std::string> endpoints{};
    ChunkerConfig chunker{};
    BackoffConfig backoff{};
};

}  // namespace tabula
