#pragma once

#include "tabula/txn/transaction_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace tabula::txn {

class Transaction;

// A validated reference to a named container. Only usable while the producing transaction is open;
// it does not own a connection.
class ResourceHandle final {
public:
    ResourceHandle(std::string name, std::weak_ptr<const TransactionStatus> transaction);

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] TransactionId transaction_id() const noexcept;
    [[nodiscard]] bool valid() const noexcept;

private:
    std::string name_{};
    TransactionId transaction_id_ = 0U;
    std::weak_ptr<const TransactionStatus> transaction_{};
};

class ResourceResolver final {
public:
    explicit ResourceResolver(ObjectStore& store);

    // Throws std::system_error with ClientErrc::AccessDenied when the store reports
    // std::errc::permission_denied and ClientErrc::NotFound for any other failure.
    [[nodiscard]] ResourceHandle resolve(std::string_view name, const Transaction& transaction) const;

private:
    ObjectStore* store_ = nullptr;
};

}  // namespace tabula::txn
