#pragma once

#include "torgrab/runtime/ControlChannel.hpp"

#include <string>
#include <vector>

namespace torgrab::runtime {

// Tor control-port client: AUTHENTICATE followed by SIGNAL NEWNYM, one connection
// per command.
class TorControlClient final : public ControlChannel {
public:
    explicit TorControlClient(std::string password = {});

    void rotateIdentity(const model::Endpoint& control, std::chrono::milliseconds timeout) override;

    // Sends the commands in order and returns the final reply line of each one.
    // Throws ControlError on the first reply whose status is not 250.
    std::vector<std::string> execute(const model::Endpoint& control,
                                     const std::vector<std::string>& commands,
                                     std::chrono::milliseconds timeout);

private:
    std::string password_;
};

// AUTHENTICATE argument as a quoted control-protocol string.
std::string quoteControlString(const std::string& value);

} // namespace torgrab::runtime
