#pragma once

#include "tabula/txn/resource_resolver.hpp"
#include "tabula/txn/transaction_types.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace tabula::txn {

class Session;

// One server-side transaction. Unopened until open() succeeds; finished by exactly one commit() or
// rollback(). A transaction destroyed while still open is rolled back best-effort through its
// session, so the session must outlive every transaction it hands out.
class Transaction final {
public:
    explicit Transaction(Session& session);
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;
    ~Transaction();

    void open();
    void commit();
    void rollback();

    // Logs the failure that is unwinding the scope, then rolls back.
    void rollback_after_failure(std::exception_ptr failure);

    [[nodiscard]] TransactionId id() const noexcept;
    [[nodiscard]] TransactionState state() const noexcept;
    [[nodiscard]] std::error_code last_error() const noexcept;
    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] ResourceHandle bucket(std::string_view name) const;
    [[nodiscard]] std::string describe() const;

    // Observed by resource handles so they can tell when this transaction has finished.
    [[nodiscard]] std::weak_ptr<const TransactionStatus> status() const noexcept;

    explicit operator bool() const noexcept;

private:
    void finish(bool commit);
    void release() noexcept;

    Session* session_ = nullptr;
    std::shared_ptr<TransactionStatus> status_{};
};

namespace detail {

template <typename Fn>
void run_guarded(Transaction& transaction, Fn&& fn)
{
    try {
        std::forward<Fn>(fn)();
    } catch (...) {
        if (transaction.is_open()) {
            transaction.rollback_after_failure(std::current_exception());
        }
        throw;
    }
}

}  // namespace detail

// Opens a transaction, runs body(transaction) and then commits on return or rolls back when the
// body throws. The body's exception is rethrown after the rollback; commit and rollback failures
// surface as std::system_error with ClientErrc::CommitFailed / ClientErrc::RollbackFailed.
template <typename Body>
auto run_in_transaction(Session& session, Body&& body) -> std::decay_t<std::invoke_result_t<Body&, Transaction&>>
{
    using Result = std::decay_t<std::invoke_result_t<Body&, Transaction&>>;

    Transaction transaction{session};
    transaction.open();

    if constexpr (std::is_void_v<Result>) {
        detail::run_guarded(transaction, [&]() { std::invoke(body, transaction); });
        if (transaction.is_open()) {
            transaction.commit();
        }
    } else {
        std::optional<Result> result{};
        detail::run_guarded(transaction, [&]() { result.emplace(std::invoke(body, transaction)); });
        if (transaction.is_open()) {
            transaction.commit();
        }
        return std::move(*result);
    }
}

}  // namespace tabula::txn
