#include "torgrab/scheduler/Backoff.hpp"

#include <algorithm>
#include <random>

namespace torgrab::scheduler {

Backoff::Backoff(BackoffOptions options)
    : options_(options) {
    options_.base = std::max(options_.base, std::chrono::milliseconds::zero());
    options_.cap = std::max(options_.cap, options_.base);
    options_.jitter = std::max(options_.jitter, std::chrono::milliseconds::zero());
}

std::chrono::milliseconds Backoff::delay(unsigned attempt, std::uint64_t seed) const {
    auto exponential = options_.base;
    for (unsigned i = 0; i < attempt && exponential < options_.cap; ++i) {
        exponential *= 2;
    }
    exponential = std::min(exponential, options_.cap);

    if (options_.jitter.count() == 0) {
        return exponential;
    }
    std::mt19937_64 engine(seed);
    std::uniform_int_distribution<std::chrono::milliseconds::rep> jitter(0, options_.jitter.count());
    return exponential + std::chrono::milliseconds{jitter(engine)};
}

} // namespace torgrab::scheduler
