#include "torgrab/runtime/CircuitRuntime.hpp"
#include "torgrab/util/Logging.hpp"

#include <utility>

namespace torgrab::runtime {

CircuitRuntime::CircuitRuntime(ContainerRuntime& runtime,
                               ControlChannel& control,
                               RuntimeHandle handle,
                               std::chrono::milliseconds controlTimeout)
    : runtime_(runtime)
    , control_(control)
    , handle_(std::move(handle))
    , controlTimeout_(controlTimeout) {}

CircuitRuntime::~CircuitRuntime() {
    if (!stopped_.load()) {
        util::log(util::LogLevel::warn, "Circuit " + handle_.name + " destroyed without stop()");
    }
}

std::unique_ptr<CircuitRuntime> CircuitRuntime::launch(ContainerRuntime& runtime,
                                                       ControlChannel& control,
                                                       const LaunchRequest& request,
                                                       std::chrono::milliseconds controlTimeout) {
    auto handle = runtime.start(request);
    util::log(util::LogLevel::debug, "Circuit " + handle.name + " up for " + request.nodeId +
                                         " proxy=" + handle.proxy.toString());
    return std::make_unique<CircuitRuntime>(runtime, control, std::move(handle), controlTimeout);
}

bool CircuitRuntime::alive() {
    if (stopped_.load()) {
        return false;
    }
    return runtime_.probe(handle_);
}

void CircuitRuntime::rotateIdentity() {
    if (stopped_.load()) {
        throw ControlError(ControlError::Type::connect_failed, 0, "Circuit " + handle_.name + " is stopped");
    }
    control_.rotateIdentity(handle_.control, controlTimeout_);
}

void CircuitRuntime::stop() {
    std::scoped_lock lock(stopMutex_);
    if (stopped_.load()) {
        return;
    }
    runtime_.stop(handle_);
    stopped_.store(true);
}

} // namespace torgrab::runtime
