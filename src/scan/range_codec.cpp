#include "tabula/scan/range_codec.hpp"

#include "tabula/common/client_errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>

namespace tabula::scan {
namespace {

constexpr char32_t kMaxCodepoint = 0x10FFFFU;
constexpr char32_t kSurrogateFirst = 0xD800U;
constexpr char32_t kSurrogateLast = 0xDFFFU;

struct DecodedChar final {
    std::size_t offset = 0U;
    std::size_t length = 0U;
    char32_t codepoint = 0U;
};

[[nodiscard]] bool is_continuation(unsigned char byte) noexcept
{
    return (byte & 0xC0U) == 0x80U;
}

[[nodiscard]] bool is_scalar_value(char32_t codepoint) noexcept
{
    return codepoint <= kMaxCodepoint && (codepoint < kSurrogateFirst || codepoint > kSurrogateLast);
}

// Decodes one character at offset; rejects overlong forms, surrogates and values past U+10FFFF.
[[nodiscard]] std::optional<DecodedChar> decode_at(std::string_view text, std::size_t offset) noexcept
{
    const auto lead = static_cast<unsigned char>(text[offset]);
    std::size_t length = 0U;
    char32_t codepoint = 0U;
    char32_t minimum = 0U;

    if (lead < 0x80U) {
        return DecodedChar{offset, 1U, lead};
    }
    if ((lead & 0xE0U) == 0xC0U) {
        length = 2U;
        codepoint = lead & 0x1FU;
        minimum = 0x80U;
    } else if ((lead & 0xF0U) == 0xE0U) {
        length = 3U;
        codepoint = lead & 0x0FU;
        minimum = 0x800U;
    } else if ((lead & 0xF8U) == 0xF0U) {
        length = 4U;
        codepoint = lead & 0x07U;
        minimum = 0x10000U;
    } else {
        return std::nullopt;
    }

    if (offset + length > text.size()) {
        return std::nullopt;
    }
    for (std::size_t index = 1U; index < length; ++index) {
        const auto byte = static_cast<unsigned char>(text[offset + index]);
        if (!is_continuation(byte)) {
            return std::nullopt;
        }
        codepoint = (codepoint << 6U) | (byte & 0x3FU);
    }

    if (codepoint < minimum || !is_scalar_value(codepoint)) {
        return std::nullopt;
    }
    return DecodedChar{offset, length, codepoint};
}

[[nodiscard]] std::string encode_utf8(char32_t codepoint)
{
    std::string out;
    if (codepoint < 0x80U) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800U) {
        out.push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    } else if (codepoint < 0x10000U) {
        out.push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (codepoint >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
    return out;
}

[[nodiscard]] DecodedChar decode_last_char(std::string_view text)
{
    DecodedChar last{};
    std::size_t offset = 0U;
    while (offset < text.size()) {
        const auto decoded = decode_at(text, offset);
        if (!decoded) {
            throw_client_error(ClientErrc::InvalidRange,
                               "Range prefix is not valid UTF-8 at byte offset " + std::to_string(offset));
        }
        last = *decoded;
        offset += decoded->length;
    }
    return last;
}

// Big-endian increment of the encoded bytes. Trailing 0xFF bytes are dropped rather than wrapped so
// the result stays the tightest bound.
[[nodiscard]] ByteString carry_increment(std::string_view bytes)
{
    ByteString upper{bytes};
    while (!upper.empty() && static_cast<unsigned char>(upper.back()) == 0xFFU) {
        upper.pop_back();
    }
    if (upper.empty()) {
        throw_client_error(ClientErrc::InvalidRange, "Range prefix has no finite upper bound");
    }
    upper.back() = static_cast<char>(static_cast<unsigned char>(upper.back()) + 1U);
    return upper;
}

std::string json_string(std::string_view bytes)
{
    std::string out{"\""};
    for (const unsigned char ch : bytes) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(ch));
        } else if (ch >= 0x20U && ch < 0x7FU) {
            out.push_back(static_cast<char>(ch));
        } else {
            fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(ch));
        }
    }
    out.push_back('"');
    return out;
}

std::string hex_string(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const unsigned char ch : bytes) {
        fmt::format_to(std::back_inserter(out), "{:02x}", static_cast<unsigned>(ch));
    }
    return out;
}

}  // namespace

bool ByteRange::contains(std::string_view key) const noexcept
{
    return std::string_view{lower} <= key && key < std::string_view{upper};
}

ByteRange prefix_to_range(std::string_view prefix)
{
    if (prefix.empty()) {
        throw_client_error(ClientErrc::InvalidRange, "Range prefix must not be empty");
    }

    const auto last = decode_last_char(prefix);
    ByteRange range{};
    range.lower = ByteString{prefix};

    if (last.codepoint < kMaxCodepoint && is_scalar_value(last.codepoint + 1U)) {
        // Re-encoding is only taken when the successor differs in the final byte alone; a change of
        // encoded length or lead byte would skip over byte strings that still sort between the bounds.
        const auto next = encode_utf8(last.codepoint + 1U);
        const auto current = prefix.substr(last.offset, last.length);
        if (next.size() == last.length && std::string_view{next}.substr(0U, next.size() - 1U)
                                               == current.substr(0U, current.size() - 1U)) {
            range.upper = ByteString{prefix.substr(0U, last.offset)} + next;
            return range;
        }
    }

    range.upper = carry_increment(prefix);
    return range;
}

std::string escape_bytes(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());
    for (const unsigned char ch : bytes) {
        if (ch >= 0x20U && ch < 0x7FU && ch != '\\' && ch != '"') {
            out.push_back(static_cast<char>(ch));
        } else {
            fmt::format_to(std::back_inserter(out), "\\x{:02x}", static_cast<unsigned>(ch));
        }
    }
    return out;
}

std::string to_json(const ByteRange& range)
{
    return fmt::format("{{\"lower\":{},\"upper\":{},\"lower_hex\":\"{}\",\"upper_hex\":\"{}\"}}",
                       json_string(range.lower),
                       json_string(range.upper),
                       hex_string(range.lower),
                       hex_string(range.upper));
}

}  // namespace tabula::scan
