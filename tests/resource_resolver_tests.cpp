#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "tabula/common/client_errors.hpp"
#include "tabula/txn/session.hpp"
#include "tabula/txn/transaction.hpp"

using tabula::ClientErrc;
using namespace tabula::txn;

namespace {

class CountingTransport final : public TransactionTransport {
public:
    TransactionId next_id = 7U;

    std::error_code begin_transaction(TransactionId& out_id) override
    {
        out_id = next_id++;
        return {};
    }

    std::error_code commit_transaction(TransactionId) override
    {
        return {};
    }

    std::error_code rollback_transaction(TransactionId) override
    {
        return {};
    }
};

class RecordingObjectStore final : public ObjectStore {
public:
    std::map<std::string, std::error_code, std::less<>> responses;
    std::vector<std::string> requested;

    std::error_code head_container(std::string_view name) override
    {
        requested.emplace_back(name);
        const auto it = responses.find(name);
        return it == responses.end() ? std::error_code{} : it->second;
    }
};

struct ResolverFixture {
    CountingTransport transport;
    RecordingObjectStore store;
    Session session{transport, store};
};

void require_client_error(const std::function<void()>& action, ClientErrc expected, const std::string& message)
{
    try {
        action();
        FAIL("expected a client error");
    } catch (const std::system_error& error) {
        CHECK(error.code() == expected);
        CHECK(std::string{error.what()}.find(message) != std::string::npos);
    }
}

}  // namespace

TEST_CASE("Existing bucket resolves to a handle bound to the transaction", "[txn]")
{
    ResolverFixture fixture;
    auto transaction = fixture.session.transaction();
    transaction.open();

    const auto handle = transaction.bucket("events");
    CHECK(handle.name() == "events");
    CHECK(handle.transaction_id() == 7U);
    CHECK(handle.valid());
    CHECK(fixture.store.requested == std::vector<std::string>{"events"});
}

TEST_CASE("Permission errors resolve to AccessDenied", "[txn]")
{
    ResolverFixture fixture;
    fixture.store.responses["secret"] = std::make_error_code(std::errc::permission_denied);

    auto transaction = fixture.session.transaction();
    transaction.open();
    require_client_error([&]() { static_cast<void>(transaction.bucket("secret")); },
                         ClientErrc::AccessDenied,
                         "Access is denied to bucket: secret");
}

TEST_CASE("Any other lookup failure resolves to NotFound", "[txn]")
{
    ResolverFixture fixture;
    fixture.store.responses["missing"] = std::make_error_code(std::errc::no_such_file_or_directory);
    fixture.store.responses["flaky"] = std::make_error_code(std::errc::timed_out);

    auto transaction = fixture.session.transaction();
    transaction.open();
    require_client_error([&]() { static_cast<void>(transaction.bucket("missing")); },
                         ClientErrc::NotFound,
                         "Bucket missing does not exist");
    require_client_error([&]() { static_cast<void>(transaction.bucket("flaky")); },
                         ClientErrc::NotFound,
                         "Bucket flaky does not exist");

    // The transaction stays usable after a failed lookup.
    CHECK(transaction.is_open());
}

TEST_CASE("Handles are invalid once the transaction finishes", "[txn]")
{
    ResolverFixture fixture;
    auto transaction = fixture.session.transaction();
    transaction.open();
    const auto handle = transaction.bucket("events");
    REQUIRE(handle.valid());

    transaction.commit();
    CHECK_FALSE(handle.valid());
    CHECK(handle.transaction_id() == 7U);
}

TEST_CASE("Handles do not outlive a destroyed transaction", "[txn]")
{
    ResolverFixture fixture;
    std::optional<ResourceHandle> handle;
    {
        auto transaction = fixture.session.transaction();
        transaction.open();
        handle.emplace(transaction.bucket("events"));
    }
    REQUIRE(handle.has_value());
    CHECK_FALSE(handle->valid());
}

TEST_CASE("Resolving requires an open transaction", "[txn]")
{
    ResolverFixture fixture;
    auto transaction = fixture.session.transaction();
    CHECK_THROWS_AS(transaction.bucket("events"), std::logic_error);
    CHECK(fixture.store.requested.empty());
}
