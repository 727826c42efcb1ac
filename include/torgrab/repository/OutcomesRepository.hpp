#pragma once

#include "torgrab/model/JobOutcome.hpp"
#include "torgrab/repository/MySqlConnectionPool.hpp"

namespace torgrab::repository {

// scrape_outcomes: one row per finished job. Pages are referenced by SHA-256.
class OutcomesRepository {
public:
    explicit OutcomesRepository(MySqlConnectionPool& pool);

    void ensureSchema();
    void insertOutcome(const model::JobOutcome& outcome);

private:
    MySqlConnectionPool& pool_;
};

} // namespace torgrab::repository
