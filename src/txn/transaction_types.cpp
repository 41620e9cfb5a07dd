#include "tabula/txn/transaction_types.hpp"

#include <spdlog/fmt/fmt.h>

namespace tabula::txn {

std::string_view transaction_state_name(TransactionState state) noexcept
{
    switch (state) {
    case TransactionState::Unopened:
        return "unopened";
    case TransactionState::Open:
        return "open";
    case TransactionState::Committed:
        return "committed";
    case TransactionState::RolledBack:
        return "rolled_back";
    case TransactionState::Failed:
        return "failed";
    }
    return "unknown";
}

std::string format_transaction_id(TransactionId id)
{
    return fmt::format("0x{:016x}", id);
}

}  // namespace tabula::txn
