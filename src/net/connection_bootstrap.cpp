#include "tabula/net/connection_bootstrap.hpp"

#include "tabula/common/client_errors.hpp"
#include "tabula/net/backoff.hpp"
#include "tabula/net/endpoint_pool.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace tabula::net {

ConnectionInfo connect(EndpointProbe& probe, const ClientConfig& config, const Sleeper& sleeper)
{
    auto pool = EndpointPool::from_specs(config.endpoints);
    const BackoffPolicy backoff{config.backoff};
    const Sleeper wait = sleeper ? sleeper : Sleeper{[](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    }};

    std::error_code last_error{};
    std::string last_endpoint{};
    for (std::size_t attempt = 0U; attempt < backoff.max_tries(); ++attempt) {
        const auto& endpoint = pool.next();
        std::string banner{};
        last_error = probe.probe(endpoint, banner);
        if (!last_error) {
            const auto version = parse_server_banner(banner);
            if (!version) {
                throw_client_error(ClientErrc::UnsupportedServer,
                                   "Server at " + endpoint + " reported unsupported banner '" + banner + "'");
            }
            SPDLOG_INFO("connected to {} (server version {}) after {} attempt(s)",
                        endpoint,
                        to_string(*version),
                        attempt + 1U);
            return ConnectionInfo{endpoint, *version, attempt + 1U};
        }

        last_endpoint = endpoint;
        if (attempt + 1U < backoff.max_tries()) {
            const auto delay = backoff.delay_for(attempt);
            SPDLOG_WARN("probe of {} failed ({}), retrying in {} ms",
                        endpoint,
                        last_error.message(),
                        delay.count());
            wait(delay);
        }
    }

    SPDLOG_ERROR("giving up after {} attempt(s); last endpoint {} failed: {}",
                 backoff.max_tries(),
                 last_endpoint,
                 last_error.message());
    throw_client_error(ClientErrc::ConnectionFailed,
                       "Could not connect after " + std::to_string(backoff.max_tries()) + " attempt(s), last error on "
                           + last_endpoint + ": " + last_error.message());
}

}  // namespace tabula::net
