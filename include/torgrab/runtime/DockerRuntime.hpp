#pragma once

#include "torgrab/runtime/ContainerRuntime.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace torgrab::runtime {

struct DockerOptions {
    std::string image{"torgrab/tor:latest"};
    std::string namePrefix{"torproxy_"};
    std::string bindAddress{"127.0.0.1"};
    std::uint16_t portMin{40001};
    std::uint16_t portMax{60001};
    std::chrono::seconds startupTimeout{60};
    std::chrono::seconds commandTimeout{120};
    std::string controlPassword;
    bool useSudo{false};
};

// Runs each exit identity as its own `tor` container: SOCKS on 9050 and the
// control port on 9051, both published on bindAddress at random free host ports.
class DockerRuntime final : public ContainerRuntime {
public:
    explicit DockerRuntime(DockerOptions options);

    RuntimeHandle start(const LaunchRequest& request) override;
    void stop(const RuntimeHandle& handle) override;
    bool probe(const RuntimeHandle& handle) override;

    // Builds the image on first use when `docker image inspect` cannot find it.
    void ensureImage();

    struct CommandResult {
        int exitCode{};
        std::string out;
        std::string err;
    };

private:
    CommandResult docker(std::vector<std::string> args, std::chrono::seconds timeout);
    std::uint16_t reserveFreePort();
    void releasePort(std::uint16_t port);

    DockerOptions options_;
    std::mutex imageMutex_;
    bool imageReady_{false};
    std::mutex portMutex_;
    std::vector<std::uint16_t> reservedPorts_;
};

std::string renderTorrc();
std::string renderDockerfile();
std::string randomContainerName(const std::string& prefix);
bool isPortOpen(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

} // namespace torgrab::runtime
