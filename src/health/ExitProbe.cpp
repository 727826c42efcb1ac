#include "torgrab/health/ExitProbe.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/ip/address.hpp>

#include <stdexcept>

namespace torgrab::health {
namespace {

// IP-echo services answer with a bare address; the same fixed UA is sent to all.
constexpr const char* kProbeUserAgent = "curl/8";

std::string trimmed(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

std::vector<std::string> defaultProbeTargets() {
    return {"https://checkip.amazonaws.com", "https://icanhazip.com", "https://api.ipify.org"};
}

ExitProbe::ExitProbe(util::HttpClient& client, std::vector<std::string> targets)
    : client_(client)
    , targets_(std::move(targets)) {
    if (targets_.empty()) {
        throw std::invalid_argument("ExitProbe needs at least one target");
    }
}

ProbeReport ExitProbe::probe(const model::Endpoint& proxy, std::chrono::milliseconds timeout) {
    ProbeReport report;
    const auto started = std::chrono::steady_clock::now();

    for (const auto& target : targets_) {
        auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - started);
        if (remaining <= std::chrono::milliseconds::zero()) {
            report.error = "probe timed out";
            break;
        }
        try {
            auto response = client_.fetch("GET", target, {{"User-Agent", kProbeUserAgent}}, {}, remaining,
                                          false, 0, nullptr, &proxy);
            if (response.result_int() != 200) {
                report.error = target + " answered " + std::to_string(response.result_int());
                continue;
            }
            auto body = trimmed(response.body());
            boost::system::error_code ec;
            boost::asio::ip::make_address(body, ec);
            if (ec) {
                report.error = target + " returned no address";
                continue;
            }
            report.healthy = true;
            report.exitAddress = body;
            report.error.clear();
            break;
        } catch (const std::exception& ex) {
            report.error = target + ": " + ex.what();
            util::log(util::LogLevel::debug, "Probe via " + proxy.toString() + " to " + report.error);
        }
    }

    report.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return report;
}

} // namespace torgrab::health
