#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::net {

constexpr std::size_t kMaxExpandedEndpoints = 4096U;

// Expands the single "<first>-<last>" component of a spec, e.g. "http://10.0.0.1-3" yields
// ".1", ".2" and ".3" in ascending order. Specs without a range token are returned unchanged.
[[nodiscard]] std::vector<std::string> expand_endpoint(std::string_view spec);
[[nodiscard]] std::vector<std::string> expand_endpoints(const std::vector<std::string>& specs);

}  // namespace tabula::net
