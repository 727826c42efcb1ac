#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace torgrab::util {

// Throws boost::system::system_error on malformed input.
boost::json::value parseJson(const std::string& payload);

// Returns nullopt when the file is missing or empty; parse errors propagate.
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

} // namespace torgrab::util
