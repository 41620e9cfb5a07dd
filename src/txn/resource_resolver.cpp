#include "tabula/txn/resource_resolver.hpp"

#include "tabula/common/client_errors.hpp"
#include "tabula/txn/transaction.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace tabula::txn {

ResourceHandle::ResourceHandle(std::string name, std::weak_ptr<const TransactionStatus> transaction)
    : name_{std::move(name)}
    , transaction_{std::move(transaction)}
{
    if (const auto status = transaction_.lock()) {
        transaction_id_ = status->id;
    }
}

const std::string& ResourceHandle::name() const noexcept
{
    return name_;
}

TransactionId ResourceHandle::transaction_id() const noexcept
{
    return transaction_id_;
}

bool ResourceHandle::valid() const noexcept
{
    const auto status = transaction_.lock();
    return status && status->state == TransactionState::Open && status->id == transaction_id_;
}

ResourceResolver::ResourceResolver(ObjectStore& store)
    : store_{&store}
{
}

ResourceHandle ResourceResolver::resolve(std::string_view name, const Transaction& transaction) const
{
    if (!transaction.is_open()) {
        throw std::logic_error{"ResourceResolver::resolve requires an open transaction"};
    }

    const auto ec = store_->head_container(name);
    if (ec == std::errc::permission_denied) {
        SPDLOG_DEBUG("access denied to bucket '{}': {}", name, ec.message());
        throw_client_error(ClientErrc::AccessDenied, "Access is denied to bucket: " + std::string{name});
    }
    if (ec) {
        SPDLOG_DEBUG("bucket '{}' lookup failed: {}", name, ec.message());
        throw_client_error(ClientErrc::NotFound, "Bucket " + std::string{name} + " does not exist");
    }

    return ResourceHandle{std::string{name}, transaction.status()};
}

}  // namespace tabula::txn
