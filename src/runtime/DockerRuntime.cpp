#include "torgrab/runtime/DockerRuntime.hpp"
#include "torgrab/util/BlockingOp.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/process.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <random>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>

namespace torgrab::runtime {
namespace {

namespace bp = boost::process;

constexpr std::uint16_t kSocksPortInContainer = 9050;
constexpr std::uint16_t kControlPortInContainer = 9051;
constexpr int kMaxPortAttempts = 100;
constexpr std::chrono::seconds kWaitStep{2};
constexpr std::chrono::milliseconds kPortCheckTimeout{500};

std::string trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::mt19937& rng() {
    static thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw RuntimeError(RuntimeError::Type::start_failed, "Cannot write " + path.string());
    }
    ofs << content;
}

} // namespace

std::string renderTorrc() {
    return "SocksPort 0.0.0.0:" + std::to_string(kSocksPortInContainer) + "\n"
           "ControlPort 0.0.0.0:" + std::to_string(kControlPortInContainer) + "\n"
           "CookieAuthentication 0\n"
           "Log notice stdout\n";
}

std::string renderDockerfile() {
    return "FROM debian:bullseye-slim\n"
           "RUN apt-get update && \\\n"
           "    apt-get install -y --no-install-recommends tor ca-certificates curl && \\\n"
           "    rm -rf /var/lib/apt/lists/*\n"
           "COPY torrc /etc/tor/torrc\n"
           "ARG CONTROL_PASSWORD=\n"
           "RUN if [ -n \"$CONTROL_PASSWORD\" ]; then \\\n"
           "      echo \"HashedControlPassword $(tor --hash-password \"$CONTROL_PASSWORD\" | tail -n 1)\" >> /etc/tor/torrc; \\\n"
           "    fi\n"
           "EXPOSE " + std::to_string(kSocksPortInContainer) + " " + std::to_string(kControlPortInContainer) + "\n"
           "CMD [\"tor\", \"-f\", \"/etc/tor/torrc\"]\n";
}

std::string randomContainerName(const std::string& prefix) {
    std::uniform_int_distribution<int> letter(0, 25);
    std::string name = prefix;
    for (int i = 0; i < 6; ++i) {
        name.push_back(static_cast<char>('a' + letter(rng())));
    }
    return name;
}

bool isPortOpen(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    try {
        boost::asio::io_context io;
        boost::asio::ip::tcp::resolver resolver(io);
        auto results = resolver.resolve(host, std::to_string(port));
        boost::beast::tcp_stream stream(io);
        stream.expires_after(timeout);
        util::runBlocking(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
        boost::system::error_code ec;
        stream.socket().close(ec);
        return true;
    } catch (const boost::system::system_error&) {
        return false;
    }
}

DockerRuntime::DockerRuntime(DockerOptions options)
    : options_(std::move(options)) {
    if (options_.portMin == 0 || options_.portMin > options_.portMax) {
        throw std::invalid_argument("Invalid docker port range");
    }
}

DockerRuntime::CommandResult DockerRuntime::docker(std::vector<std::string> args, std::chrono::seconds timeout) {
    std::string program = options_.useSudo ? "sudo" : "docker";
    if (options_.useSudo) {
        args.insert(args.begin(), "docker");
    }

    auto executable = bp::search_path(program);
    if (executable.empty()) {
        throw RuntimeError(RuntimeError::Type::unavailable, program + " CLI not found on PATH");
    }

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    std::unique_ptr<bp::child> child;
    try {
        child = std::make_unique<bp::child>(executable, bp::args(args), bp::std_in.close(),
                                            bp::std_out > out, bp::std_err > err, ios);
    } catch (const bp::process_error& ex) {
        throw RuntimeError(RuntimeError::Type::unavailable, "Failed to launch " + program + ": " + ex.what());
    }

    ios.run_for(timeout);
    if (!ios.stopped()) {
        std::error_code ec;
        child->terminate(ec);
        throw RuntimeError(RuntimeError::Type::timeout,
                           "docker " + (args.empty() ? std::string{} : args.front()) + " timed out");
    }

    std::error_code ec;
    child->wait(ec);
    if (ec) {
        util::log(util::LogLevel::debug, "docker wait reported: " + ec.message());
    }

    CommandResult result;
    result.exitCode = child->exit_code();
    result.out = out.get();
    result.err = err.get();
    return result;
}

void DockerRuntime::ensureImage() {
    std::scoped_lock lock(imageMutex_);
    if (imageReady_) {
        return;
    }

    auto inspect = docker({"image", "inspect", options_.image}, options_.commandTimeout);
    if (inspect.exitCode == 0) {
        imageReady_ = true;
        return;
    }

    auto buildDir = std::filesystem::temp_directory_path() / randomContainerName("torgrab_build_");
    std::filesystem::create_directories(buildDir);
    util::log(util::LogLevel::info, "Building image " + options_.image + " in " + buildDir.string());

    CommandResult build;
    try {
        writeFile(buildDir / "torrc", renderTorrc());
        writeFile(buildDir / "Dockerfile", renderDockerfile());
        std::vector<std::string> args{"build", "-t", options_.image};
        if (!options_.controlPassword.empty()) {
            args.push_back("--build-arg");
            args.push_back("CONTROL_PASSWORD=" + options_.controlPassword);
        }
        args.push_back(buildDir.string());
        build = docker(std::move(args), options_.commandTimeout * 5);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove_all(buildDir, ec);
        throw;
    }
    std::error_code ec;
    std::filesystem::remove_all(buildDir, ec);
    if (ec) {
        util::log(util::LogLevel::warn, "Could not remove " + buildDir.string() + ": " + ec.message());
    }

    if (build.exitCode != 0) {
        throw RuntimeError(RuntimeError::Type::start_failed,
                           "docker build of " + options_.image + " failed: " + trim(build.err));
    }
    imageReady_ = true;
}

std::uint16_t DockerRuntime::reserveFreePort() {
    std::uniform_int_distribution<int> dist(options_.portMin, options_.portMax);
    for (int attempt = 0; attempt < kMaxPortAttempts; ++attempt) {
        auto port = static_cast<std::uint16_t>(dist(rng()));
        {
            std::scoped_lock lock(portMutex_);
            if (std::find(reservedPorts_.begin(), reservedPorts_.end(), port) != reservedPorts_.end()) {
                continue;
            }
            reservedPorts_.push_back(port);
        }
        if (!isPortOpen(options_.bindAddress, port, kPortCheckTimeout)) {
            return port;
        }
        releasePort(port);
    }
    throw RuntimeError(RuntimeError::Type::start_failed,
                       "No free port found in " + std::to_string(options_.portMin) + "-" +
                           std::to_string(options_.portMax));
}

void DockerRuntime::releasePort(std::uint16_t port) {
    std::scoped_lock lock(portMutex_);
    reservedPorts_.erase(std::remove(reservedPorts_.begin(), reservedPorts_.end(), port), reservedPorts_.end());
}

RuntimeHandle DockerRuntime::start(const LaunchRequest& request) {
    ensureImage();

    // Ports stay reserved until docker owns the bindings, so parallel starts never collide.
    struct PortReservation {
        DockerRuntime& runtime;
        std::uint16_t port;
        ~PortReservation() { runtime.releasePort(port); }
    };
    PortReservation socks{*this, reserveFreePort()};
    PortReservation control{*this, reserveFreePort()};

    RuntimeHandle handle;
    handle.name = randomContainerName(options_.namePrefix);
    handle.proxy = model::Endpoint{options_.bindAddress, socks.port};
    handle.control = model::Endpoint{options_.bindAddress, control.port};

    auto run = docker({"run", "-d",
                       "--name", handle.name,
                       "--label", "torgrab.node=" + request.nodeId,
                       "--restart", "unless-stopped",
                       "-p", options_.bindAddress + ":" + std::to_string(socks.port) + ":" + std::to_string(kSocksPortInContainer),
                       "-p", options_.bindAddress + ":" + std::to_string(control.port) + ":" + std::to_string(kControlPortInContainer),
                       options_.image},
                      options_.commandTimeout);
    if (run.exitCode != 0) {
        throw RuntimeError(RuntimeError::Type::start_failed,
                           "docker run for " + handle.name + " failed: " + trim(run.err));
    }
    handle.id = trim(run.out);
    util::log(util::LogLevel::info, "Started container " + handle.name + " SOCKS " + handle.proxy.toString() +
                                        " control " + handle.control.toString());

    const auto deadline = std::chrono::steady_clock::now() + options_.startupTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (isPortOpen(handle.proxy.host, handle.proxy.port, kPortCheckTimeout)) {
            return handle;
        }
        std::this_thread::sleep_for(kWaitStep);
    }

    util::log(util::LogLevel::warn, "Container " + handle.name + " did not open its SOCKS port; removing it");
    try {
        stop(handle);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Cleanup of " + handle.name + " failed: " + ex.what());
    }
    throw RuntimeError(RuntimeError::Type::timeout,
                       "Port " + handle.proxy.toString() + " did not open within " +
                           std::to_string(options_.startupTimeout.count()) + "s");
}

void DockerRuntime::stop(const RuntimeHandle& handle) {
    auto result = docker({"rm", "-f", handle.name}, options_.commandTimeout);
    if (result.exitCode == 0) {
        util::log(util::LogLevel::info, "Removed container " + handle.name);
        return;
    }
    if (result.err.find("No such container") != std::string::npos) {
        util::log(util::LogLevel::debug, "Container " + handle.name + " already gone");
        return;
    }
    throw RuntimeError(RuntimeError::Type::stop_failed, "docker rm -f " + handle.name + " failed: " + trim(result.err));
}

bool DockerRuntime::probe(const RuntimeHandle& handle) {
    auto result = docker({"inspect", "-f", "{{.State.Running}}", handle.name}, options_.commandTimeout);
    return result.exitCode == 0 && trim(result.out) == "true";
}

} // namespace torgrab::runtime
