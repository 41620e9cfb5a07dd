#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "tabula/common/client_errors.hpp"
#include "tabula/txn/session.hpp"
#include "tabula/txn/transaction.hpp"

using tabula::ClientErrc;
using tabula::ClientErrcCondition;
using namespace tabula::txn;

namespace {

struct TransportAbort {
};

class RecordingTransport final : public TransactionTransport {
public:
    std::vector<std::string> events;
    TransactionId next_id = 0x1000U;
    std::error_code begin_result{};
    std::error_code commit_result{};
    std::error_code rollback_result{};
    bool throw_on_commit = false;
    bool abort_on_begin = false;
    bool abort_on_rollback = false;

    std::error_code begin_transaction(TransactionId& out_id) override
    {
        events.emplace_back("begin");
        if (abort_on_begin) {
            throw TransportAbort{};
        }
        if (begin_result) {
            return begin_result;
        }
        out_id = next_id++;
        return {};
    }

    std::error_code commit_transaction(TransactionId id) override
    {
        events.push_back("commit " + std::to_string(id));
        if (throw_on_commit) {
            throw std::runtime_error{"socket closed"};
        }
        return commit_result;
    }

    std::error_code rollback_transaction(TransactionId id) override
    {
        events.push_back("rollback " + std::to_string(id));
        if (abort_on_rollback) {
            throw TransportAbort{};
        }
        return rollback_result;
    }
};

class NullObjectStore final : public ObjectStore {
public:
    std::error_code head_container(std::string_view) override
    {
        return {};
    }
};

struct SessionFixture {
    RecordingTransport transport;
    NullObjectStore store;
    Session session{transport, store};
};

std::error_code failure_code(const std::function<void()>& action)
{
    try {
        action();
    } catch (const std::system_error& error) {
        return error.code();
    }
    return {};
}

}  // namespace

TEST_CASE("Transaction opens with the id returned by begin", "[txn]")
{
    SessionFixture fixture;
    auto transaction = fixture.session.transaction();
    CHECK(transaction.state() == TransactionState::Unopened);
    CHECK_FALSE(static_cast<bool>(transaction));

    transaction.open();
    CHECK(transaction.state() == TransactionState::Open);
    CHECK(transaction.id() == 0x1000U);
    CHECK(static_cast<bool>(transaction));
    CHECK(transaction.describe() == "Transaction(id=0x0000000000001000)");

    transaction.commit();
    CHECK(transaction.state() == TransactionState::Committed);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "commit 4096"});
}

TEST_CASE("Unopened transaction describes itself with a zero id", "[txn]")
{
    SessionFixture fixture;
    const auto transaction = fixture.session.transaction();
    CHECK(transaction.describe() == "Transaction(id=0x0000000000000000)");
    CHECK(format_transaction_id(0xDEADBEEFCAFEULL) == "0x0000deadbeefcafe");
}

TEST_CASE("Scope exit commits exactly once", "[txn]")
{
    SessionFixture fixture;
    const auto result = run_in_transaction(fixture.session, [](Transaction& transaction) {
        CHECK(transaction.is_open());
        return transaction.id() + 1U;
    });

    CHECK(result == 0x1001U);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "commit 4096"});

    const auto telemetry = fixture.session.telemetry_snapshot();
    CHECK(telemetry.opened_transactions == 1U);
    CHECK(telemetry.committed_transactions == 1U);
    CHECK(telemetry.rolled_back_transactions == 0U);
}

TEST_CASE("Failure inside the scope rolls back exactly once and rethrows", "[txn]")
{
    SessionFixture fixture;
    CHECK_THROWS_AS(run_in_transaction(fixture.session,
                                       [](Transaction&) { throw std::runtime_error{"insert failed"}; }),
                    std::runtime_error);

    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "rollback 4096"});
    const auto telemetry = fixture.session.telemetry_snapshot();
    CHECK(telemetry.rolled_back_transactions == 1U);
    CHECK(telemetry.committed_transactions == 0U);
}

TEST_CASE("Body may finish the transaction itself", "[txn]")
{
    SessionFixture fixture;
    run_in_transaction(fixture.session, [](Transaction& transaction) { transaction.rollback(); });
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "rollback 4096"});
}

TEST_CASE("Commit failure surfaces as CommitFailed", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.commit_result = std::make_error_code(std::errc::timed_out);

    const auto ec = failure_code([&]() { run_in_transaction(fixture.session, [](Transaction&) {}); });
    CHECK(ec == ClientErrc::CommitFailed);
    CHECK(ec == ClientErrcCondition::TransactionFailure);
    CHECK(fixture.session.telemetry_snapshot().commit_failures == 1U);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "commit 4096"});
}

TEST_CASE("Rollback failure surfaces as RollbackFailed distinct from commit", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.rollback_result = std::make_error_code(std::errc::connection_reset);

    auto transaction = fixture.session.transaction();
    transaction.open();
    const auto ec = failure_code([&]() { transaction.rollback(); });
    CHECK(ec == ClientErrc::RollbackFailed);
    CHECK(ec != ClientErrc::CommitFailed);
    CHECK(ec == ClientErrcCondition::TransactionFailure);
    CHECK(transaction.state() == TransactionState::Failed);
    CHECK(transaction.last_error() == ClientErrc::RollbackFailed);
    CHECK(fixture.session.telemetry_snapshot().rollback_failures == 1U);
}

TEST_CASE("Rollback failure while unwinding a body failure is raised", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.rollback_result = std::make_error_code(std::errc::connection_reset);

    const auto ec = failure_code([&]() {
        run_in_transaction(fixture.session, [](Transaction&) {
            throw std::system_error{std::make_error_code(std::errc::invalid_argument), "bad row"};
        });
    });
    CHECK(ec == ClientErrc::RollbackFailed);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "rollback 4096"});
}

TEST_CASE("Transport exceptions become typed transaction failures", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.throw_on_commit = true;

    auto transaction = fixture.session.transaction();
    transaction.open();
    try {
        transaction.commit();
        FAIL("expected CommitFailed");
    } catch (const std::system_error& error) {
        CHECK(error.code() == ClientErrc::CommitFailed);
        CHECK(std::string{error.what()}.find("socket closed") != std::string::npos);
        CHECK(std::string{error.what()}.find("0x0000000000001000") != std::string::npos);
    }
}

TEST_CASE("Non-standard transport exceptions still finish the transaction once", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.abort_on_rollback = true;

    const auto ec = failure_code([&]() {
        run_in_transaction(fixture.session, [](Transaction&) { throw std::runtime_error{"insert failed"}; });
    });
    CHECK(ec == ClientErrc::RollbackFailed);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "rollback 4096"});

    const auto telemetry = fixture.session.telemetry_snapshot();
    CHECK(telemetry.rollback_failures == 1U);
    CHECK(telemetry.rolled_back_transactions == 0U);
}

TEST_CASE("Non-standard exception from begin surfaces as BeginFailed", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.abort_on_begin = true;

    auto transaction = fixture.session.transaction();
    try {
        transaction.open();
        FAIL("expected BeginFailed");
    } catch (const std::system_error& error) {
        CHECK(error.code() == ClientErrc::BeginFailed);
        CHECK(std::string{error.what()}.find("non-standard exception") != std::string::npos);
    }
    CHECK(transaction.state() == TransactionState::Failed);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin"});
}

TEST_CASE("Begin failure leaves no open transaction", "[txn]")
{
    SessionFixture fixture;
    fixture.transport.begin_result = std::make_error_code(std::errc::host_unreachable);

    bool body_ran = false;
    const auto ec = failure_code([&]() { run_in_transaction(fixture.session, [&](Transaction&) { body_ran = true; }); });
    CHECK(ec == ClientErrc::BeginFailed);
    CHECK(ec == ClientErrcCondition::TransactionFailure);
    CHECK_FALSE(body_ran);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin"});
    CHECK(fixture.session.telemetry_snapshot().begin_failures == 1U);
}

TEST_CASE("Transaction state transitions are enforced", "[txn]")
{
    SessionFixture fixture;
    auto transaction = fixture.session.transaction();
    CHECK_THROWS_AS(transaction.commit(), std::logic_error);

    transaction.open();
    CHECK_THROWS_AS(transaction.open(), std::logic_error);

    transaction.commit();
    CHECK_THROWS_AS(transaction.commit(), std::logic_error);
    CHECK_THROWS_AS(transaction.rollback(), std::logic_error);
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "commit 4096"});
}

TEST_CASE("Open transaction is rolled back when destroyed", "[txn]")
{
    SessionFixture fixture;
    {
        auto transaction = fixture.session.transaction();
        transaction.open();
    }
    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "rollback 4096"});

    fixture.transport.rollback_result = std::make_error_code(std::errc::connection_reset);
    {
        auto transaction = fixture.session.transaction();
        transaction.open();
    }
    CHECK(fixture.transport.events.back() == "rollback 4097");
    CHECK(fixture.session.telemetry_snapshot().rollback_failures == 1U);
}

TEST_CASE("Moved transaction keeps a single owner", "[txn]")
{
    SessionFixture fixture;
    auto first = fixture.session.transaction();
    first.open();

    auto second = std::move(first);
    CHECK(second.is_open());
    second.commit();

    CHECK(fixture.transport.events == std::vector<std::string>{"begin", "commit 4096"});
}

TEST_CASE("Transaction ids are independent across transactions", "[txn]")
{
    SessionFixture fixture;
    std::vector<TransactionId> ids;
    for (int round = 0; round < 3; ++round) {
        ids.push_back(run_in_transaction(fixture.session, [](Transaction& transaction) { return transaction.id(); }));
    }
    CHECK(ids == std::vector<TransactionId>{0x1000U, 0x1001U, 0x1002U});
    CHECK(fixture.session.telemetry_snapshot().committed_transactions == 3U);
}

TEST_CASE("State violations name the current state", "[txn]")
{
    SessionFixture fixture;
    auto transaction = fixture.session.transaction();
    transaction.open();
    transaction.commit();

    try {
        transaction.rollback();
        FAIL("expected std::logic_error");
    } catch (const std::logic_error& error) {
        CHECK(std::string{error.what()}.find("state is committed") != std::string::npos);
    }
    CHECK(transaction_state_name(TransactionState::RolledBack) == "rolled_back");
}
