#pragma once

#include <cstdint>
#include <string>

namespace torgrab::model {

struct Endpoint {
    std::string host;
    std::uint16_t port{};

    std::string toString() const { return host + ":" + std::to_string(port); }

    bool empty() const noexcept { return host.empty() || port == 0; }
};

inline bool operator==(const Endpoint& lhs, const Endpoint& rhs) {
    return lhs.host == rhs.host && lhs.port == rhs.port;
}

} // namespace torgrab::model
