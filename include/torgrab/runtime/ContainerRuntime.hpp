#pragma once

#include "torgrab/model/Endpoint.hpp"

#include <stdexcept>
#include <string>

namespace torgrab::runtime {

class RuntimeError : public std::runtime_error {
public:
    enum class Type {
        unavailable,
        start_failed,
        stop_failed,
        timeout,
    };

    RuntimeError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

private:
    Type type_;
};

struct LaunchRequest {
    std::string nodeId;
};

// What the runtime hands back for one started identity. Opaque to everything
// outside ExitNodePool.
struct RuntimeHandle {
    std::string name;
    std::string id;
    model::Endpoint proxy;
    model::Endpoint control;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Blocks until the proxy port accepts connections; throws RuntimeError.
    virtual RuntimeHandle start(const LaunchRequest& request) = 0;
    // Removing an already-gone resource is not an error.
    virtual void stop(const RuntimeHandle& handle) = 0;
    virtual bool probe(const RuntimeHandle& handle) = 0;
};

} // namespace torgrab::runtime
