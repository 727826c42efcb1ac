#pragma once

#include "torgrab/model/Endpoint.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace torgrab::runtime {

class ControlError : public std::runtime_error {
public:
    enum class Type {
        connect_failed,
        auth_rejected,
        command_rejected,
        timeout,
        protocol,
    };

    ControlError(Type type, int code, const std::string& message)
        : std::runtime_error(message)
        , type_(type)
        , code_(code) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    Type type_;
    int code_;
};

class ControlChannel {
public:
    virtual ~ControlChannel() = default;

    // Asks the circuit behind `control` for a fresh identity. Idempotent; throws
    // ControlError when the command is not acknowledged within `timeout`.
    virtual void rotateIdentity(const model::Endpoint& control, std::chrono::milliseconds timeout) = 0;
};

} // namespace torgrab::runtime
