#include "torgrab/repository/MySqlConnectionPool.hpp"
#include "torgrab/util/Logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace torgrab::repository {

MySqlConnectionPool::MySqlConnectionPool(DatabaseConfig config)
    : config_(std::move(config)) {
    if (config_.database.empty()) {
        throw std::runtime_error("Database name must be provided in configuration");
    }
    if (config_.host.empty()) {
        config_.host = "127.0.0.1";
    }
    config_.poolSize = std::max(1u, config_.poolSize);
}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::connect() {
    try {
        auto session = std::make_unique<mysqlx::Session>(
            mysqlx::SessionOption::HOST, config_.host,
            mysqlx::SessionOption::PORT, static_cast<unsigned int>(config_.port),
            mysqlx::SessionOption::USER, config_.user,
            mysqlx::SessionOption::PWD, config_.password);
        if (!config_.charset.empty()) {
            session->sql("SET NAMES '" + config_.charset + "'").execute();
        }
        session->sql("CREATE DATABASE IF NOT EXISTS `" + config_.database + "`").execute();
        session->sql("USE `" + config_.database + "`").execute();
        util::log(util::LogLevel::debug, "Opened MySQL session to " + config_.host + ":" + std::to_string(config_.port));
        return session;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"MySQL connect to "} + config_.host + " failed: " + err.what());
        throw;
    }
}

bool MySqlConnectionPool::stillAlive(mysqlx::Session& session) {
    try {
        session.sql("SELECT 1").execute();
        return true;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::warn, std::string{"Dropping stale MySQL session: "} + err.what());
        return false;
    }
}

std::shared_ptr<mysqlx::Session> MySqlConnectionPool::lend(std::unique_ptr<mysqlx::Session> session) {
    return std::shared_ptr<mysqlx::Session>(session.release(), [this](mysqlx::Session* raw) { giveBack(raw); });
}

std::shared_ptr<mysqlx::Session> MySqlConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool available = slotFreed_.wait_for(lock, timeout, [this]() {
        return !idle_.empty() || open_ < config_.poolSize;
    });
    if (!available) {
        throw std::runtime_error("No MySQL session became free within " + std::to_string(timeout.count()) + "ms");
    }

    while (!idle_.empty()) {
        IdleSession candidate = std::move(idle_.back());
        idle_.pop_back();
        if (std::chrono::steady_clock::now() - candidate.returnedAt < kValidateAfter) {
            return lend(std::move(candidate.session));
        }
        lock.unlock();
        const bool alive = stillAlive(*candidate.session);
        lock.lock();
        if (alive) {
            return lend(std::move(candidate.session));
        }
        // Its slot is reused for the fresh connection below.
        --open_;
    }

    ++open_;
    lock.unlock();
    try {
        return lend(connect());
    } catch (const std::exception&) {
        {
            std::scoped_lock relock(mutex_);
            --open_;
        }
        slotFreed_.notify_one();
        throw;
    }
}

void MySqlConnectionPool::discard(const mysqlx::Session& session) {
    std::scoped_lock lock(mutex_);
    broken_.insert(&session);
}

void MySqlConnectionPool::giveBack(mysqlx::Session* session) {
    std::unique_ptr<mysqlx::Session> owned(session);
    {
        std::scoped_lock lock(mutex_);
        if (broken_.erase(owned.get()) != 0) {
            --open_;
        } else {
            idle_.push_back(IdleSession{std::move(owned), std::chrono::steady_clock::now()});
        }
    }
    slotFreed_.notify_one();
    // A discarded session is closed here, outside the lock.
}

} // namespace torgrab::repository
