#include "tabula/txn/transaction.hpp"

#include "tabula/common/client_errors.hpp"
#include "tabula/txn/session.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace tabula::txn {
namespace {

std::string describe_failure(const std::exception_ptr& failure)
{
    if (!failure) {
        return "unknown failure";
    }
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& error) {
        return error.what();
    } catch (...) {
        return "non-standard exception";
    }
}

}  // namespace

Transaction::Transaction(Session& session)
    : session_{&session}
    , status_{std::make_shared<TransactionStatus>()}
{
}

Transaction::Transaction(Transaction&& other) noexcept
    : session_{other.session_}
    , status_{std::move(other.status_)}
{
    other.session_ = nullptr;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept
{
    if (this != &other) {
        release();
        session_ = other.session_;
        status_ = std::move(other.status_);
        other.session_ = nullptr;
    }
    return *this;
}

Transaction::~Transaction()
{
    release();
}

void Transaction::open()
{
    if (session_ == nullptr || !status_ || status_->state != TransactionState::Unopened) {
        throw std::logic_error{"Transaction::open requires an unopened transaction, state is "
                               + std::string{transaction_state_name(state())}};
    }

    TransactionId id = 0U;
    std::error_code ec{};
    std::string cause{};
    try {
        ec = session_->transport().begin_transaction(id);
        if (ec) {
            cause = ec.message();
        }
    } catch (const std::exception& error) {
        ec = std::make_error_code(std::errc::io_error);
        cause = error.what();
    } catch (...) {
        ec = std::make_error_code(std::errc::io_error);
        cause = "non-standard exception";
    }

    if (ec) {
        status_->state = TransactionState::Failed;
        status_->last_error = make_error_code(ClientErrc::BeginFailed);
        session_->telemetry_.begin_failures.fetch_add(1U, std::memory_order_relaxed);
        SPDLOG_ERROR("begin transaction failed: {}", cause);
        throw_client_error(ClientErrc::BeginFailed, "Begin transaction failed: " + cause);
    }

    status_->id = id;
    status_->state = TransactionState::Open;
    session_->telemetry_.opened_transactions.fetch_add(1U, std::memory_order_relaxed);
    SPDLOG_DEBUG("opened txid={}", format_transaction_id(id));
}

void Transaction::commit()
{
    finish(true);
}

void Transaction::rollback()
{
    finish(false);
}

void Transaction::rollback_after_failure(std::exception_ptr failure)
{
    if (!is_open()) {
        throw std::logic_error{"Transaction::rollback_after_failure requires an open transaction"};
    }
    SPDLOG_ERROR("rolling back txid={} after failure: {}", format_transaction_id(status_->id), describe_failure(failure));
    finish(false);
}

void Transaction::finish(bool commit)
{
    const char* verb = commit ? "commit" : "rollback";
    if (!is_open()) {
        throw std::logic_error{std::string{"Transaction::"} + verb + " requires an open transaction, state is "
                               + std::string{transaction_state_name(state())}};
    }

    const auto id = status_->id;
    SPDLOG_DEBUG("{} txid={}", commit ? "committing" : "rolling back", format_transaction_id(id));

    auto& transport = session_->transport();
    std::error_code ec{};
    std::string cause{};
    try {
        ec = commit ? transport.commit_transaction(id) : transport.rollback_transaction(id);
        if (ec) {
            cause = ec.message();
        }
    } catch (const std::exception& error) {
        ec = std::make_error_code(std::errc::io_error);
        cause = error.what();
    } catch (...) {
        ec = std::make_error_code(std::errc::io_error);
        cause = "non-standard exception";
    }

    auto& telemetry = session_->telemetry_;
    if (ec) {
        // A failed commit leaves durability unknown; a failed rollback leaves the abort incomplete.
        const auto code = commit ? ClientErrc::CommitFailed : ClientErrc::RollbackFailed;
        status_->state = TransactionState::Failed;
        status_->last_error = make_error_code(code);
        (commit ? telemetry.commit_failures : telemetry.rollback_failures).fetch_add(1U, std::memory_order_relaxed);
        SPDLOG_ERROR("{} of txid={} failed: {}", verb, format_transaction_id(id), cause);
        throw_client_error(code,
                           std::string{commit ? "Commit" : "Rollback"} + " of transaction " + format_transaction_id(id)
                               + " failed: " + cause);
    }

    status_->state = commit ? TransactionState::Committed : TransactionState::RolledBack;
    status_->last_error = {};
    (commit ? telemetry.committed_transactions : telemetry.rolled_back_transactions)
        .fetch_add(1U, std::memory_order_relaxed);
}

void Transaction::release() noexcept
{
    if (session_ == nullptr || !is_open()) {
        return;
    }

    try {
        SPDLOG_WARN("txid={} released while open, rolling back", format_transaction_id(status_->id));
        finish(false);
    } catch (const std::exception& error) {
        SPDLOG_ERROR("best-effort rollback failed: {}", error.what());
    }
}

TransactionId Transaction::id() const noexcept
{
    return status_ ? status_->id : 0U;
}

TransactionState Transaction::state() const noexcept
{
    return status_ ? status_->state : TransactionState::Unopened;
}

std::error_code Transaction::last_error() const noexcept
{
    return status_ ? status_->last_error : std::error_code{};
}

bool Transaction::is_open() const noexcept
{
    return status_ && status_->state == TransactionState::Open;
}

ResourceHandle Transaction::bucket(std::string_view name) const
{
    if (session_ == nullptr) {
        throw std::logic_error{"Transaction::bucket requires a session"};
    }
    return session_->resolver().resolve(name, *this);
}

std::string Transaction::describe() const
{
    return "Transaction(id=" + format_transaction_id(id()) + ")";
}

std::weak_ptr<const TransactionStatus> Transaction::status() const noexcept
{
    return status_;
}

Transaction::operator bool() const noexcept
{
    return is_open();
}

}  // namespace tabula::txn
