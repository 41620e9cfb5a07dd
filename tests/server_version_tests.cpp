#include <catch2/catch_test_macros.hpp>

#include <optional>

#include "tabula/net/server_version.hpp"

using tabula::net::parse_server_banner;
using tabula::net::ServerVersion;

TEST_CASE("Four-component banner parses", "[connect]")
{
    const auto version = parse_server_banner("vast 5.2.0.10");
    REQUIRE(version.has_value());
    CHECK(version->major == 5U);
    CHECK(version->minor == 2U);
    CHECK(version->patch == 0U);
    CHECK(version->protocol == 10U);
    CHECK(tabula::net::to_string(*version) == "5.2.0.10");
}

TEST_CASE("Banners in any other form are rejected", "[connect]")
{
    CHECK_FALSE(parse_server_banner("vast 5").has_value());
    CHECK_FALSE(parse_server_banner("vast 5.2").has_value());
    CHECK_FALSE(parse_server_banner("vast 5.2.0").has_value());
    CHECK_FALSE(parse_server_banner("vast 5.2.0.10.1").has_value());
    CHECK_FALSE(parse_server_banner("vast 5.2.0.10-rc1").has_value());
    CHECK_FALSE(parse_server_banner("vast 5.2.0.10 ").has_value());
    CHECK_FALSE(parse_server_banner("vast").has_value());
    CHECK_FALSE(parse_server_banner("5.2.0.10").has_value());
    CHECK_FALSE(parse_server_banner("").has_value());
    CHECK_FALSE(parse_server_banner("vast 5.2.0.99999999999").has_value());
}

TEST_CASE("Server versions order by component", "[connect]")
{
    CHECK(ServerVersion{5U, 2U, 0U, 10U} < ServerVersion{5U, 3U, 0U, 0U});
    CHECK(ServerVersion{5U, 2U, 0U, 10U} == *parse_server_banner("other 5.2.0.10"));
}
