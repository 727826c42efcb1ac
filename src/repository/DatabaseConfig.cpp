#include "torgrab/repository/DatabaseConfig.hpp"

#include <string_view>

namespace torgrab::repository {
namespace {

void assignString(const boost::json::object& json, std::string_view key, std::string& out) {
    if (const auto* value = json.if_contains(key); value && value->is_string()) {
        out.assign(value->get_string().begin(), value->get_string().end());
    }
}

template <typename T>
void assignNumber(const boost::json::object& json, std::string_view key, T& out) {
    if (const auto* value = json.if_contains(key); value && value->is_number()) {
        out = static_cast<T>(value->to_number<std::int64_t>());
    }
}

} // namespace

DatabaseConfig loadConfig(const boost::json::object& json) {
    DatabaseConfig cfg;
    assignString(json, "host", cfg.host);
    assignNumber(json, "port", cfg.port);
    assignString(json, "user", cfg.user);
    assignString(json, "password", cfg.password);
    assignString(json, "database", cfg.database);
    assignString(json, "charset", cfg.charset);
    assignNumber(json, "poolSize", cfg.poolSize);
    return cfg;
}

} // namespace torgrab::repository
