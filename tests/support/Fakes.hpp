#pragma once

#include "torgrab/health/EndpointProber.hpp"
#include "torgrab/runtime/ContainerRuntime.hpp"
#include "torgrab/runtime/ControlChannel.hpp"
#include "torgrab/scheduler/Fetcher.hpp"
#include "torgrab/sink/ResultSink.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace torgrab::test {

// Polls `predicate` until it holds or `timeout` passes.
template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// In-memory container runtime. Each start hands out a fresh proxy port.
class FakeRuntime : public runtime::ContainerRuntime {
public:
    runtime::RuntimeHandle start(const runtime::LaunchRequest& request) override {
        std::scoped_lock lock(mutex_);
        ++startCalls_;
        if (failStarts_) {
            throw runtime::RuntimeError(failType_, "docker daemon not reachable");
        }
        runtime::RuntimeHandle handle;
        handle.name = "fake_" + request.nodeId;
        handle.id = std::to_string(startCalls_);
        handle.proxy = model::Endpoint{"127.0.0.1", nextPort_++};
        handle.control = model::Endpoint{"127.0.0.1", nextPort_++};
        running_.insert(handle.name);
        return handle;
    }

    void stop(const runtime::RuntimeHandle& handle) override {
        std::scoped_lock lock(mutex_);
        ++stopCalls_[handle.name];
        running_.erase(handle.name);
    }

    bool probe(const runtime::RuntimeHandle& handle) override {
        std::scoped_lock lock(mutex_);
        return running_.count(handle.name) != 0 && crashed_.count(handle.name) == 0;
    }

    void failStarts(bool fail, runtime::RuntimeError::Type type = runtime::RuntimeError::Type::unavailable) {
        std::scoped_lock lock(mutex_);
        failStarts_ = fail;
        failType_ = type;
    }

    void crash(const std::string& name) {
        std::scoped_lock lock(mutex_);
        crashed_.insert(name);
    }

    int startCalls() const {
        std::scoped_lock lock(mutex_);
        return startCalls_;
    }

    int stopCalls(const std::string& name) const {
        std::scoped_lock lock(mutex_);
        auto it = stopCalls_.find(name);
        return it == stopCalls_.end() ? 0 : it->second;
    }

    std::size_t running() const {
        std::scoped_lock lock(mutex_);
        return running_.size();
    }

private:
    mutable std::mutex mutex_;
    int startCalls_{};
    std::uint16_t nextPort_{41000};
    bool failStarts_{false};
    runtime::RuntimeError::Type failType_{runtime::RuntimeError::Type::unavailable};
    std::set<std::string> running_;
    std::set<std::string> crashed_;
    std::map<std::string, int> stopCalls_;
};

class FakeControl : public runtime::ControlChannel {
public:
    void rotateIdentity(const model::Endpoint& control, std::chrono::milliseconds) override {
        if (fail_) {
            throw runtime::ControlError(runtime::ControlError::Type::command_rejected, 552,
                                        "552 Unrecognized signal");
        }
        std::scoped_lock lock(mutex_);
        rotated_.push_back(control.port);
    }

    void setFailing(bool fail) { fail_ = fail; }

    std::size_t rotations() const {
        std::scoped_lock lock(mutex_);
        return rotated_.size();
    }

private:
    mutable std::mutex mutex_;
    std::atomic<bool> fail_{false};
    std::vector<std::uint16_t> rotated_;
};

// Healthy by default; individual proxy ports can be marked unhealthy.
class FakeProber : public health::EndpointProber {
public:
    health::ProbeReport probe(const model::Endpoint& proxy, std::chrono::milliseconds) override {
        std::scoped_lock lock(mutex_);
        ++calls_;
        health::ProbeReport report;
        if (allUnhealthy_ || unhealthy_.count(proxy.port) != 0) {
            report.error = "ProbeFailed: no route through " + proxy.toString();
            return report;
        }
        report.healthy = true;
        report.exitAddress = "198.51.100." + std::to_string(proxy.port % 250);
        report.latency = std::chrono::milliseconds(1);
        return report;
    }

    void setHealthy(std::uint16_t port, bool healthy) {
        std::scoped_lock lock(mutex_);
        if (healthy) {
            unhealthy_.erase(port);
        } else {
            unhealthy_.insert(port);
        }
    }

    void setAllUnhealthy(bool unhealthy) {
        std::scoped_lock lock(mutex_);
        allUnhealthy_ = unhealthy;
    }

    int calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::uint16_t> unhealthy_;
    bool allUnhealthy_{false};
    int calls_{};
};

class ScriptedFetcher : public scheduler::Fetcher {
public:
    using Script = std::function<scheduler::FetchResult(const scheduler::FetchRequest&, int call)>;

    explicit ScriptedFetcher(Script script)
        : script_(std::move(script)) {}

    scheduler::FetchResult fetch(const scheduler::FetchRequest& request) override {
        int call = 0;
        {
            std::scoped_lock lock(mutex_);
            call = ++calls_;
            urls_.push_back(request.targetUrl);
        }
        return script_(request, call);
    }

    int calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    std::vector<std::string> urls() const {
        std::scoped_lock lock(mutex_);
        return urls_;
    }

    static scheduler::FetchResult ok(const std::string& body) {
        scheduler::FetchResult result;
        result.ok = true;
        result.statusCode = 200;
        result.body = body;
        result.contentType = "text/plain";
        return result;
    }

    static scheduler::FetchResult failed(int status) {
        scheduler::FetchResult result;
        result.statusCode = status;
        result.error = "RequestFailed: HTTP " + std::to_string(status);
        return result;
    }

private:
    Script script_;
    mutable std::mutex mutex_;
    int calls_{};
    std::vector<std::string> urls_;
};

class RecordingSink : public sink::ResultSink {
public:
    void onSucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) override {
        std::scoped_lock lock(mutex_);
        succeeded_[jobId] = artifact;
    }

    void onAbandoned(const std::string& jobId, const std::string& reason) override {
        std::scoped_lock lock(mutex_);
        abandoned_[jobId] = reason;
    }

    std::map<std::string, model::ScrapeArtifact> succeeded() const {
        std::scoped_lock lock(mutex_);
        return succeeded_;
    }

    std::map<std::string, std::string> abandoned() const {
        std::scoped_lock lock(mutex_);
        return abandoned_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, model::ScrapeArtifact> succeeded_;
    std::map<std::string, std::string> abandoned_;
};

} // namespace torgrab::test
