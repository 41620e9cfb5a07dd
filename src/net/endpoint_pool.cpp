#include "tabula/net/endpoint_pool.hpp"

#include "tabula/common/client_errors.hpp"
#include "tabula/net/endpoint_expander.hpp"

#include <utility>

namespace tabula::net {

EndpointPool::EndpointPool(std::vector<std::string> endpoints)
    : endpoints_{std::move(endpoints)}
{
    if (endpoints_.empty()) {
        throw_client_error(ClientErrc::InvalidEndpoint, "Endpoint pool requires at least one endpoint");
    }
}

EndpointPool EndpointPool::from_specs(const std::vector<std::string>& specs)
{
    return EndpointPool{expand_endpoints(specs)};
}

const std::string& EndpointPool::next()
{
    const auto& endpoint = endpoints_[cursor_];
    cursor_ = (cursor_ + 1U) % endpoints_.size();
    return endpoint;
}

std::size_t EndpointPool::size() const noexcept
{
    return endpoints_.size();
}

const std::vector<std::string>& EndpointPool::endpoints() const noexcept
{
    return endpoints_;
}

}  // namespace tabula::net
