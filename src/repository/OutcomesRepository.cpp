#include "torgrab/repository/OutcomesRepository.hpp"
#include "torgrab/util/Logging.hpp"

#include <mysqlx/xdevapi.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace torgrab::repository {
namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

mysqlx::Value toTimestampValue(const std::chrono::system_clock::time_point& tp) {
    if (tp.time_since_epoch().count() == 0) {
        return mysqlx::Value();
    }
    return mysqlx::Value(formatTimestamp(tp));
}

mysqlx::Value stringOrNull(const std::string& value) {
    if (value.empty()) {
        return mysqlx::Value();
    }
    return mysqlx::Value(value);
}

} // namespace

OutcomesRepository::OutcomesRepository(MySqlConnectionPool& pool)
    : pool_(pool) {}

void OutcomesRepository::ensureSchema() {
    auto session = pool_.acquire();
    try {
        session->sql("CREATE TABLE IF NOT EXISTS scrape_outcomes ("
                     "id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY, "
                     "job_id VARCHAR(64) NOT NULL, "
                     "status VARCHAR(16) NOT NULL, "
                     "target_url TEXT NULL, "
                     "node_id VARCHAR(64) NULL, "
                     "exit_address VARCHAR(64) NULL, "
                     "status_code INT NOT NULL DEFAULT 0, "
                     "body_bytes BIGINT UNSIGNED NOT NULL DEFAULT 0, "
                     "content_digest CHAR(64) NULL, "
                     "attempts INT NOT NULL DEFAULT 0, "
                     "reason TEXT NULL, "
                     "finished_at DATETIME NULL, "
                     "created_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP, "
                     "KEY idx_scrape_outcomes_job (job_id))")
            .execute();
    } catch (const mysqlx::Error& err) {
        pool_.discard(*session);
        util::log(util::LogLevel::error, std::string{"Create scrape_outcomes failed: "} + err.what());
        throw;
    }
}

void OutcomesRepository::insertOutcome(const model::JobOutcome& outcome) {
    auto session = pool_.acquire();
    try {
        mysqlx::Schema schema = session->getSchema(pool_.schemaName());
        mysqlx::Table table = schema.getTable("scrape_outcomes");
        table.insert("job_id",
                     "status",
                     "target_url",
                     "node_id",
                     "exit_address",
                     "status_code",
                     "body_bytes",
                     "content_digest",
                     "attempts",
                     "reason",
                     "finished_at")
            .values(outcome.jobId,
                    std::string{model::toString(outcome.status)},
                    stringOrNull(outcome.targetUrl),
                    stringOrNull(outcome.nodeId),
                    stringOrNull(outcome.exitAddress),
                    outcome.statusCode,
                    outcome.bodyBytes,
                    stringOrNull(outcome.contentDigest),
                    static_cast<int>(outcome.attempts),
                    stringOrNull(outcome.reason),
                    toTimestampValue(outcome.finishedAt))
            .execute();
    } catch (const mysqlx::Error& err) {
        pool_.discard(*session);
        util::log(util::LogLevel::error, std::string{"Insert outcome for "} + outcome.jobId + " failed: " + err.what());
        throw;
    }
}

} // namespace torgrab::repository
