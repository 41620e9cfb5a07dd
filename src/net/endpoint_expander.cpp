#include "tabula/net/endpoint_expander.hpp"

#include "tabula/common/client_errors.hpp"
#include "tabula/net/endpoint_grammar.hpp"

#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>

namespace tabula::net {
namespace {

namespace pegtl = tao::pegtl;

struct EndpointParseState final {
    std::string prefix{};
    std::string suffix{};
    std::optional<std::uint64_t> first{};
    std::optional<std::uint64_t> last{};
    std::size_t range_tokens = 0U;
    char previous = '\0';
    bool at_start = true;

    [[nodiscard]] bool starts_component() const noexcept
    {
        return at_start || previous == '.' || previous == '/' || previous == ':' || previous == '@';
    }

    void append(const std::string& text)
    {
        if (text.empty()) {
            return;
        }
        (range_tokens == 0U ? prefix : suffix).append(text);
        previous = text.back();
        at_start = false;
    }
};

[[noreturn]] void fail_endpoint(std::string_view spec, const std::string& detail)
{
    throw_client_error(ClientErrc::InvalidEndpoint, "Endpoint '" + std::string{spec} + "': " + detail);
}

std::optional<std::uint64_t> parse_number(std::string_view text)
{
    std::uint64_t value = 0U;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

template <typename Rule>
struct endpoint_action {
    template <typename ActionInput>
    static void apply(const ActionInput&, EndpointParseState&)
    {
    }
};

template <>
struct endpoint_action<grammar::range_token> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, EndpointParseState& state)
    {
        const auto text = in.string();
        if (!state.starts_component()) {
            state.append(text);
            return;
        }

        ++state.range_tokens;
        if (state.range_tokens > 1U) {
            return;
        }

        const auto dash = text.find('-');
        state.first = parse_number(std::string_view{text}.substr(0U, dash));
        state.last = parse_number(std::string_view{text}.substr(dash + 1U));
        state.previous = text.back();
        state.at_start = false;
    }
};

template <>
struct endpoint_action<grammar::digit_run> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, EndpointParseState& state)
    {
        state.append(in.string());
    }
};

template <>
struct endpoint_action<grammar::literal_char> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, EndpointParseState& state)
    {
        state.append(in.string());
    }
};

}  // namespace

std::vector<std::string> expand_endpoint(std::string_view spec)
{
    pegtl::memory_input in(spec.data(), spec.size(), "endpoint");
    EndpointParseState state{};

    try {
        if (!pegtl::parse<grammar::endpoint_spec, endpoint_action>(in, state)) {
            fail_endpoint(spec, "does not match the endpoint grammar");
        }
    } catch (const pegtl::parse_error& error) {
        fail_endpoint(spec, error.what());
    }

    if (state.range_tokens == 0U) {
        return {std::string{spec}};
    }
    if (state.range_tokens > 1U) {
        fail_endpoint(spec, "only one numeric range is allowed");
    }
    if (!state.first || !state.last) {
        fail_endpoint(spec, "range bounds are out of range");
    }

    const auto first = *state.first;
    const auto last = *state.last;
    if (first > last) {
        fail_endpoint(spec, "range start " + std::to_string(first) + " exceeds range end " + std::to_string(last));
    }
    if (last - first >= kMaxExpandedEndpoints) {
        fail_endpoint(spec, "range expands to more than " + std::to_string(kMaxExpandedEndpoints) + " endpoints");
    }

    std::vector<std::string> endpoints;
    endpoints.reserve(static_cast<std::size_t>(last - first + 1U));
    for (std::uint64_t step = 0U; step <= last - first; ++step) {
        endpoints.push_back(state.prefix + std::to_string(first + step) + state.suffix);
    }
    return endpoints;
}

std::vector<std::string> expand_endpoints(const std::vector<std::string>& specs)
{
    std::vector<std::string> endpoints;
    for (const auto& spec : specs) {
        auto expanded = expand_endpoint(spec);
        endpoints.insert(endpoints.end(),
                         std::make_move_iterator(expanded.begin()),
                         std::make_move_iterator(expanded.end()));
    }
    return endpoints;
}

}  // namespace tabula::net
