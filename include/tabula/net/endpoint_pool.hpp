#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tabula::net {

// Round-robin view over concrete endpoints. Not thread-safe; owned by the connection setup path.
class EndpointPool final {
public:
    explicit EndpointPool(std::vector<std::string> endpoints);

    static EndpointPool from_specs(const std::vector<std::string>& specs);

    [[nodiscard]] const std::string& next();
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] const std::vector<std::string>& endpoints() const noexcept;

private:
    std::vector<std::string> endpoints_{};
    std::size_t cursor_ = 0U;
};

}  // namespace tabula::net
