#include "torgrab/util/UserAgent.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <string_view>

namespace torgrab::util {
namespace {

struct Platform {
    std::string_view name;
    std::array<std::string_view, 3> versions;
    std::size_t versionCount;
};

constexpr std::array<Platform, 4> kPlatforms{{
    {"Windows NT", {"10.0", "11.0", ""}, 2},
    {"Macintosh; Intel Mac OS X", {"15.5", "14.6", "13.6"}, 3},
    {"X11; Linux", {"x86_64", "i686", ""}, 2},
    {"X11; Ubuntu; Linux", {"x86_64", "i686", ""}, 2},
}};

constexpr std::array<std::string_view, 4> kFirefoxVersions{"140.0", "141.0", "142.0", "143.0"};

template <typename T>
std::size_t pick(std::mt19937& rng, T size) {
    std::uniform_int_distribution<std::size_t> dist(0, static_cast<std::size_t>(size) - 1);
    return dist(rng);
}

} // namespace

std::string randomDesktopUserAgent() {
    static thread_local std::mt19937 rng{std::random_device{}()};

    const auto& platform = kPlatforms[pick(rng, kPlatforms.size())];
    std::string osVersion(platform.versions[pick(rng, platform.versionCount)]);

    std::string os(platform.name);
    os += ' ';
    os += osVersion;
    if (platform.name == "Windows NT") {
        os += "; Win64; x64";
    }

    std::string version(kFirefoxVersions[pick(rng, kFirefoxVersions.size())]);
    return "Mozilla/5.0 (" + os + "; rv:" + version + ") Gecko/20100101 Firefox/" + version;
}

} // namespace torgrab::util
