#pragma once

#include "torgrab/repository/DatabaseConfig.hpp"

#include <mysqlx/xdevapi.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace torgrab::repository {

// Bounded set of X DevAPI sessions for the outcome writers.
//
// acquire() waits up to `timeout` for a free slot and throws std::runtime_error
// when none frees up. Sessions idle for longer than kValidateAfter are checked
// with `SELECT 1` before being lent again; a session reported through
// discard() is closed on return instead of going back to the idle list.
class MySqlConnectionPool {
public:
    static constexpr std::chrono::seconds kValidateAfter{30};

    explicit MySqlConnectionPool(DatabaseConfig config);

    std::shared_ptr<mysqlx::Session> acquire(std::chrono::milliseconds timeout = std::chrono::seconds(10));
    void discard(const mysqlx::Session& session);

    const std::string& schemaName() const noexcept { return config_.database; }

private:
    struct IdleSession {
        std::unique_ptr<mysqlx::Session> session;
        std::chrono::steady_clock::time_point returnedAt;
    };

    std::unique_ptr<mysqlx::Session> connect();
    bool stillAlive(mysqlx::Session& session);
    std::shared_ptr<mysqlx::Session> lend(std::unique_ptr<mysqlx::Session> session);
    void giveBack(mysqlx::Session* session);

    DatabaseConfig config_;
    std::mutex mutex_;
    std::condition_variable slotFreed_;
    std::vector<IdleSession> idle_;
    std::unordered_set<const mysqlx::Session*> broken_;
    unsigned int open_{};
};

} // namespace torgrab::repository
