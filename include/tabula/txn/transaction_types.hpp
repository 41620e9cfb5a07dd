#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace tabula::txn {

using TransactionId = std::uint64_t;

enum class TransactionState {
    Unopened,
    Open,
    Committed,
    RolledBack,
    Failed
};

struct TransactionStatus final {
    TransactionId id = 0U;
    TransactionState state = TransactionState::Unopened;
    std::error_code last_error{};
};

[[nodiscard]] std::string_view transaction_state_name(TransactionState state) noexcept;

// Renders an id as "0x" followed by 16 lowercase hex digits.
[[nodiscard]] std::string format_transaction_id(TransactionId id);

class TransactionTransport {
public:
    virtual ~TransactionTransport() = default;

    virtual std::error_code begin_transaction(TransactionId& out_id) = 0;
    virtual std::error_code commit_transaction(TransactionId id) = 0;
    virtual std::error_code rollback_transaction(TransactionId id) = 0;
};

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // std::errc::permission_denied when the caller may not access the container.
    virtual std::error_code head_container(std::string_view name) = 0;
};

}  // namespace tabula::txn
