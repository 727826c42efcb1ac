#pragma once

#include "torgrab/model/Endpoint.hpp"

#include <chrono>
#include <string>

namespace torgrab::scheduler {

struct FetchRequest {
    std::string targetUrl;
    model::Endpoint proxy;
    std::chrono::milliseconds timeout{};
};

struct FetchResult {
    bool ok{false};
    int statusCode{};
    std::string body;
    std::string contentType;
    std::string effectiveUrl;
    std::string error;
    bool timedOut{false};
    std::chrono::milliseconds elapsed{};
};

// Issues one outbound request through the given proxy. Expected failures come
// back in FetchResult; an exception is treated as RequestFailed by the caller.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual FetchResult fetch(const FetchRequest& request) = 0;
};

} // namespace torgrab::scheduler
