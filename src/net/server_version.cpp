#include "tabula/net/server_version.hpp"

#include "tabula/net/endpoint_grammar.hpp"

#include <charconv>
#include <vector>

namespace tabula::net {
namespace {

namespace pegtl = tao::pegtl;

struct BannerParseState final {
    std::vector<std::uint32_t> components{};
    bool overflow = false;
};

template <typename Rule>
struct banner_action {
    template <typename ActionInput>
    static void apply(const ActionInput&, BannerParseState&)
    {
    }
};

template <>
struct banner_action<grammar::version_number> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, BannerParseState& state)
    {
        std::uint32_t value = 0U;
        const auto* begin = in.begin();
        const auto* end = in.end();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end) {
            state.overflow = true;
            return;
        }
        state.components.push_back(value);
    }
};

}  // namespace

std::optional<ServerVersion> parse_server_banner(std::string_view banner)
{
    pegtl::memory_input in(banner.data(), banner.size(), "server_banner");
    BannerParseState state{};

    if (!pegtl::parse<grammar::server_banner, banner_action>(in, state)) {
        return std::nullopt;
    }
    if (state.overflow || state.components.size() != 4U) {
        return std::nullopt;
    }

    ServerVersion version{};
    version.major = state.components[0];
    version.minor = state.components[1];
    version.patch = state.components[2];
    version.protocol = state.components[3];
    return version;
}

std::string to_string(const ServerVersion& version)
{
    return std::to_string(version.major) + "." + std::to_string(version.minor) + "." + std::to_string(version.patch)
           + "." + std::to_string(version.protocol);
}

}  // namespace tabula::net
