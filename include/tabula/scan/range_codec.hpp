#pragma once

#include <string>
#include <string_view>

namespace tabula::scan {

// Raw byte strings; ordering follows std::char_traits<char>, which compares as unsigned char.
using ByteString = std::string;

struct ByteRange final {
    ByteString lower{};
    ByteString upper{};

    // Half-open: lower <= key < upper.
    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    bool operator==(const ByteRange&) const = default;
};

// Returns the tightest [lower, upper) interval covering every byte string that starts with the
// UTF-8 encoded prefix. Throws std::system_error(ClientErrc::InvalidRange) for an empty prefix or
// malformed UTF-8.
[[nodiscard]] ByteRange prefix_to_range(std::string_view prefix);

// Printable ASCII is kept; every other byte, plus '\\' and '"', becomes \xNN.
[[nodiscard]] std::string escape_bytes(std::string_view bytes);

// {"lower":...,"upper":...,"lower_hex":...,"upper_hex":...}. The string fields map each byte to the
// code point of the same value (\u00NN); the hex fields carry the exact bytes.
[[nodiscard]] std::string to_json(const ByteRange& range);

}  // namespace tabula::scan
