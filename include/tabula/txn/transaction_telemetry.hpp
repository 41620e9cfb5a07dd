#pragma once

#include <cstdint>

namespace tabula::txn {

struct TransactionTelemetrySnapshot final {
    std::uint64_t opened_transactions = 0U;
    std::uint64_t committed_transactions = 0U;
    std::uint64_t rolled_back_transactions = 0U;
    std::uint64_t begin_failures = 0U;
    std::uint64_t commit_failures = 0U;
    std::uint64_t rollback_failures = 0U;
};

}  // namespace tabula::txn
