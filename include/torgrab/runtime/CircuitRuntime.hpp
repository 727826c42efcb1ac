#pragma once

#include "torgrab/runtime/ContainerRuntime.hpp"
#include "torgrab/runtime/ControlChannel.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace torgrab::runtime {

// One running exit identity. Owned by ExitNodePool; callers outside the pool only
// ever see its endpoints.
class CircuitRuntime {
public:
    CircuitRuntime(ContainerRuntime& runtime,
                   ControlChannel& control,
                   RuntimeHandle handle,
                   std::chrono::milliseconds controlTimeout);
    ~CircuitRuntime();

    CircuitRuntime(const CircuitRuntime&) = delete;
    CircuitRuntime& operator=(const CircuitRuntime&) = delete;

    // Starts a new identity through the container runtime. Throws RuntimeError.
    static std::unique_ptr<CircuitRuntime> launch(ContainerRuntime& runtime,
                                                  ControlChannel& control,
                                                  const LaunchRequest& request,
                                                  std::chrono::milliseconds controlTimeout);

    const model::Endpoint& proxyEndpoint() const noexcept { return handle_.proxy; }
    const model::Endpoint& controlEndpoint() const noexcept { return handle_.control; }
    const std::string& name() const noexcept { return handle_.name; }

    // False once stopped or when the runtime reports the resource gone.
    bool alive();

    // New identity on the same resource. Throws ControlError.
    void rotateIdentity();

    // Tears the resource down. Only the first call reaches the runtime.
    void stop();

    bool stopped() const noexcept { return stopped_.load(); }

private:
    ContainerRuntime& runtime_;
    ControlChannel& control_;
    RuntimeHandle handle_;
    std::chrono::milliseconds controlTimeout_;
    std::mutex stopMutex_;
    std::atomic<bool> stopped_{false};
};

} // namespace torgrab::runtime
