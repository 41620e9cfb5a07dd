#pragma once

#include "tabula/client_config.hpp"
#include "tabula/net/server_version.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <system_error>

namespace tabula::net {

class EndpointProbe {
public:
    virtual ~EndpointProbe() = default;

    // Issues one identification request; on success out_banner holds the server banner.
    virtual std::error_code probe(const std::string& endpoint, std::string& out_banner) = 0;
};

struct ConnectionInfo final {
    std::string endpoint{};
    ServerVersion version{};
    std::size_t attempts = 0U;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Probes the expanded endpoints round robin until one answers, waiting between failures per the
// backoff config. Throws ConnectionFailed once max_tries probes have failed and UnsupportedServer
// when a reachable server reports a banner that does not parse.
[[nodiscard]] ConnectionInfo connect(EndpointProbe& probe, const ClientConfig& config, const Sleeper& sleeper = {});

}  // namespace tabula::net
