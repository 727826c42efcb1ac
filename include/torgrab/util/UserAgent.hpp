#pragma once

#include <string>

namespace torgrab::util {

// Firefox desktop User-Agent with a randomly chosen platform and version.
std::string randomDesktopUserAgent();

} // namespace torgrab::util
