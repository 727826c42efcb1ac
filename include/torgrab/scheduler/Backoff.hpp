#pragma once

#include <chrono>
#include <cstdint>

namespace torgrab::scheduler {

struct BackoffOptions {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{60000};
    std::chrono::milliseconds jitter{500};
};

// delay = min(base * 2^attempt, cap) + uniform(0, jitter). The jitter is drawn
// from `seed`, so a job keeps the same offset across its retries.
class Backoff {
public:
    explicit Backoff(BackoffOptions options);

    std::chrono::milliseconds delay(unsigned attempt, std::uint64_t seed) const;

    const BackoffOptions& options() const noexcept { return options_; }

private:
    BackoffOptions options_;
};

} // namespace torgrab::scheduler
