#pragma once

#include "torgrab/scheduler/Fetcher.hpp"
#include "torgrab/util/HttpClient.hpp"

namespace torgrab::scheduler {

// GET over the node's SOCKS endpoint with a fresh desktop User-Agent per request.
// Redirects are followed within the same deadline; status >= 400 is a failure.
class HttpFetcher final : public Fetcher {
public:
    explicit HttpFetcher(util::HttpClient& client, unsigned maxRedirects = 5);

    FetchResult fetch(const FetchRequest& request) override;

private:
    util::HttpClient& client_;
    unsigned maxRedirects_;
};

} // namespace torgrab::scheduler
