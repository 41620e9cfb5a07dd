#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tabula::net {

struct ServerVersion final {
    std::uint32_t major = 0U;
    std::uint32_t minor = 0U;
    std::uint32_t patch = 0U;
    std::uint32_t protocol = 0U;

    auto operator<=>(const ServerVersion&) const = default;
};

// Accepts exactly "<product> <major>.<minor>.<patch>.<protocol>".
[[nodiscard]] std::optional<ServerVersion> parse_server_banner(std::string_view banner);
[[nodiscard]] std::string to_string(const ServerVersion& version);

}  // namespace tabula::net
