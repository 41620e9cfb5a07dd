#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>

#include "tabula/common/client_errors.hpp"

using tabula::ClientErrc;
using tabula::ClientErrcCondition;

TEST_CASE("Client error codes carry the client category", "[errors]")
{
    const std::error_code ec = ClientErrc::TooWideRow;
    CHECK(ec.category() == tabula::client_error_category());
    CHECK(std::string{ec.category().name()} == "tabula.client");
    CHECK(ec.message() == "row too wide to fit in a chunk");
    CHECK(ec == ClientErrc::TooWideRow);
    CHECK(ec != ClientErrc::InvalidRange);
}

TEST_CASE("Transaction failure condition groups the transaction codes", "[errors]")
{
    CHECK(std::error_code{ClientErrc::BeginFailed} == ClientErrcCondition::TransactionFailure);
    CHECK(std::error_code{ClientErrc::CommitFailed} == ClientErrcCondition::TransactionFailure);
    CHECK(std::error_code{ClientErrc::RollbackFailed} == ClientErrcCondition::TransactionFailure);

    CHECK(std::error_code{ClientErrc::NotFound} != ClientErrcCondition::TransactionFailure);
    CHECK(std::error_code{ClientErrc::AccessDenied} != ClientErrcCondition::TransactionFailure);
    CHECK(std::make_error_code(std::errc::io_error) != ClientErrcCondition::TransactionFailure);
}

TEST_CASE("throw_client_error raises system_error with the code and message", "[errors]")
{
    try {
        tabula::throw_client_error(ClientErrc::NotFound, "Bucket logs does not exist");
        FAIL("expected std::system_error");
    } catch (const std::system_error& error) {
        CHECK(error.code() == ClientErrc::NotFound);
        CHECK(std::string{error.what()}.find("Bucket logs does not exist") != std::string::npos);
    }
}
