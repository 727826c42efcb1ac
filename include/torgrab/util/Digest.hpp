#pragma once

#include <string>
#include <string_view>

namespace torgrab::util {

// Lowercase hex SHA-256, used as the content handle of a scraped page.
std::string sha256Hex(std::string_view data);

} // namespace torgrab::util
