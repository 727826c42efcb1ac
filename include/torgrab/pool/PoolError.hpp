#pragma once

#include <stdexcept>
#include <string>

namespace torgrab::pool {

class PoolError : public std::runtime_error {
public:
    enum class Type {
        exhausted,
        shutting_down,
        node_creation_failed,
    };

    PoolError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

private:
    Type type_;
};

inline const char* toString(PoolError::Type type) {
    switch (type) {
    case PoolError::Type::exhausted:            return "PoolExhausted";
    case PoolError::Type::shutting_down:        return "PoolShuttingDown";
    case PoolError::Type::node_creation_failed: return "NodeCreationFailed";
    }
    return "PoolError";
}

} // namespace torgrab::pool
