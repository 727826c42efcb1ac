#include "torgrab/scheduler/HttpFetcher.hpp"
#include "torgrab/util/UserAgent.hpp"

#include <boost/beast/core/error.hpp>

namespace torgrab::scheduler {

HttpFetcher::HttpFetcher(util::HttpClient& client, unsigned maxRedirects)
    : client_(client)
    , maxRedirects_(maxRedirects) {}

FetchResult HttpFetcher::fetch(const FetchRequest& request) {
    FetchResult result;
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    };

    std::vector<util::HttpClient::Header> headers{
        {"User-Agent", util::randomDesktopUserAgent()},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"Connection", "close"},
    };

    try {
        auto response = client_.fetch("GET", request.targetUrl, headers, {}, request.timeout, true, maxRedirects_,
                                      &result.effectiveUrl, &request.proxy);
        result.statusCode = response.result_int();
        auto contentType = response.base().find(boost::beast::http::field::content_type);
        if (contentType != response.base().end()) {
            result.contentType = std::string(contentType->value());
        }
        result.body = std::move(response.body());
        result.ok = result.statusCode < 400;
        if (!result.ok) {
            result.error = "RequestFailed: HTTP " + std::to_string(result.statusCode);
        }
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::beast::error::timeout) {
            result.timedOut = true;
            result.error = "RequestTimeout: no response within " + std::to_string(request.timeout.count()) + "ms";
        } else {
            result.error = std::string{"RequestFailed: "} + ex.what();
        }
    } catch (const std::exception& ex) {
        result.error = std::string{"RequestFailed: "} + ex.what();
    }

    result.elapsed = elapsed();
    return result;
}

} // namespace torgrab::scheduler
