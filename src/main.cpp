#include "torgrab/config/EngineConfig.hpp"
#include "torgrab/health/ExitProbe.hpp"
#include "torgrab/health/HealthMonitor.hpp"
#include "torgrab/pool/ExitNodePool.hpp"
#include "torgrab/pool/RotationPolicy.hpp"
#include "torgrab/repository/MySqlConnectionPool.hpp"
#include "torgrab/repository/OutcomesRepository.hpp"
#include "torgrab/runtime/DockerRuntime.hpp"
#include "torgrab/runtime/TorControlClient.hpp"
#include "torgrab/scheduler/HttpFetcher.hpp"
#include "torgrab/scheduler/ScrapeScheduler.hpp"
#include "torgrab/sink/LogResultSink.hpp"
#include "torgrab/sink/MySqlResultSink.hpp"
#include "torgrab/util/HttpClient.hpp"
#include "torgrab/util/Logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace {
    using namespace torgrab;

    void startPoolReport(boost::asio::io_context& io, pool::ExitNodePool& pool, scheduler::ScrapeScheduler& jobs) {
        auto timer = std::make_shared<boost::asio::steady_timer>(io);
        auto handler = std::make_shared<std::function<void(const boost::system::error_code&)>>();
        *handler = [timer, &pool, &jobs, handler](const boost::system::error_code& ec) {
            if (!ec) {
                std::size_t ready = 0, inUse = 0, quarantined = 0, starting = 0;
                for (const auto& node : pool.snapshot()) {
                    switch (node.state) {
                    case model::NodeState::ready: ++ready; break;
                    case model::NodeState::in_use: ++inUse; break;
                    case model::NodeState::quarantined: ++quarantined; break;
                    case model::NodeState::starting: ++starting; break;
                    default: break;
                    }
                }
                util::log(util::LogLevel::info, "Pool: " + std::to_string(ready) + " ready, " + std::to_string(inUse) +
                                                    " in use, " + std::to_string(quarantined) + " quarantined, " +
                                                    std::to_string(starting) + " starting");
                std::size_t pending = 0, dispatched = 0, succeeded = 0, abandoned = 0;
                for (const auto& job : jobs.jobs()) {
                    switch (job.status) {
                    case model::JobStatus::pending: ++pending; break;
                    case model::JobStatus::dispatched: ++dispatched; break;
                    case model::JobStatus::succeeded: ++succeeded; break;
                    case model::JobStatus::abandoned: ++abandoned; break;
                    default: break;
                    }
                }
                util::log(util::LogLevel::info, "Jobs: " + std::to_string(pending) + " pending, " +
                                                    std::to_string(dispatched) + " dispatched, " +
                                                    std::to_string(succeeded) + " succeeded, " +
                                                    std::to_string(abandoned) + " abandoned");
                timer->expires_after(std::chrono::seconds(30));
                timer->async_wait(*handler);
            }
            };
        timer->expires_after(std::chrono::seconds(30));
        timer->async_wait(*handler);
    }

    // One job per line: <url> [priority] [maxAttempts]. Blank lines and '#' comments are skipped.
    void submitLine(const std::string& line, scheduler::ScrapeScheduler& jobs) {
        std::istringstream iss(line);
        std::string url;
        if (!(iss >> url) || url.front() == '#') {
            return;
        }
        int priority = 0;
        std::optional<unsigned> maxAttempts;
        if (iss >> priority) {
            unsigned attempts = 0;
            if (iss >> attempts) {
                maxAttempts = attempts;
            }
        }
        auto id = jobs.submit(url, priority, maxAttempts);
        util::log(util::LogLevel::info, "Submitted " + id + " for " + url);
    }

    struct JobReader {
        boost::asio::posix::stream_descriptor input;
        std::string buffer;
        scheduler::ScrapeScheduler& jobs;
        std::function<void()> onEof;

        void read() {
            boost::asio::async_read_until(input, boost::asio::dynamic_buffer(buffer), '\n',
                                          [this](const boost::system::error_code& ec, std::size_t length) {
                                              if (!ec) {
                                                  submitLine(buffer.substr(0, length - 1), jobs);
                                                  buffer.erase(0, length);
                                                  read();
                                                  return;
                                              }
                                              if (ec != boost::asio::error::eof) {
                                                  util::log(util::LogLevel::error, "Reading jobs failed: " + ec.message());
                                              }
                                              if (!buffer.empty()) {
                                                  submitLine(buffer, jobs);
                                                  buffer.clear();
                                              }
                                              onEof();
                                          });
        }
    };

} // namespace

int main(int argc, char** argv) {
    using namespace torgrab;
    util::initLogging(util::LogLevel::info);

    std::filesystem::path configPath = argc > 1 ? argv[1] : "data/torgrab.json";
    auto engineConfig = config::loadEngineConfig(configPath);
    util::initLogging(engineConfig.logLevel);

    boost::asio::io_context io;
    boost::asio::thread_pool workerPool(std::max(4u, std::thread::hardware_concurrency()));

    runtime::DockerRuntime docker{engineConfig.runtime};
    runtime::TorControlClient control{engineConfig.runtime.controlPassword};
    util::HttpClient httpClient;
    health::ExitProbe exitProbe{httpClient, engineConfig.probeTargets};

    auto policy = std::make_shared<pool::ThresholdRotationPolicy>(engineConfig.rotation);
    pool::ExitNodePool nodePool{docker, control, exitProbe, policy, workerPool, engineConfig.pool};
    nodePool.setHealthListener([](pool::PoolHealth state, const std::string& detail) {
        if (state == pool::PoolHealth::runtime_unreachable) {
            util::log(util::LogLevel::error, "HEALTH: container runtime unreachable: " + detail);
        } else {
            util::log(util::LogLevel::info, "HEALTH: container runtime recovered");
        }
    });

    std::unique_ptr<repository::MySqlConnectionPool> connectionPool;
    std::unique_ptr<repository::OutcomesRepository> outcomes;
    std::unique_ptr<sink::ResultSink> resultSink;
    if (engineConfig.persistOutcomes) {
        util::log(util::LogLevel::info, "Persisting outcomes to MySQL " + engineConfig.database.host + ":" +
                                            std::to_string(engineConfig.database.port) + "/" + engineConfig.database.database);
        try {
            connectionPool = std::make_unique<repository::MySqlConnectionPool>(engineConfig.database);
            outcomes = std::make_unique<repository::OutcomesRepository>(*connectionPool);
            outcomes->ensureSchema();
            resultSink = std::make_unique<sink::MySqlResultSink>(*outcomes, workerPool);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, std::string{"MySQL unavailable, logging outcomes instead: "} + ex.what());
        }
    }
    if (!resultSink) {
        resultSink = std::make_unique<sink::LogResultSink>();
    }

    scheduler::HttpFetcher fetcher{httpClient};
    scheduler::ScrapeScheduler jobScheduler{nodePool, fetcher, *resultSink, engineConfig.scheduler};
    health::HealthMonitor monitor{nodePool, io, workerPool, engineConfig.health};

    try {
        docker.ensureImage();
    } catch (const runtime::RuntimeError& ex) {
        util::log(util::LogLevel::error, std::string{"Preparing the tor image failed: "} + ex.what());
    }

    nodePool.start();
    monitor.start();
    jobScheduler.start();
    startPoolReport(io, nodePool, jobScheduler);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            util::log(util::LogLevel::info, "Signal " + std::to_string(signo) + " received, shutting down");
            io.stop();
        }
    });

    JobReader reader{boost::asio::posix::stream_descriptor(io, ::dup(STDIN_FILENO)), {}, jobScheduler, {}};
    reader.onEof = [&io, &workerPool, &jobScheduler]() {
        util::log(util::LogLevel::info, "Job input closed, waiting for outstanding jobs");
        boost::asio::post(workerPool, [&io, &jobScheduler]() {
            while (!io.stopped() && !jobScheduler.waitIdle(std::chrono::milliseconds(500))) {
            }
            io.stop();
        });
    };
    reader.read();

    util::log(util::LogLevel::info, "torgrab reading jobs from stdin");
    io.run();

    jobScheduler.stop();
    monitor.stop();
    if (!nodePool.drain(engineConfig.pool.checkoutTimeout + engineConfig.scheduler.requestTimeout)) {
        util::log(util::LogLevel::warn, "Pool drain timed out with nodes still alive");
    }
    workerPool.join();
    util::log(util::LogLevel::info, "torgrab stopped");
    return 0;
}
