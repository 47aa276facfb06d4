#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace util {

// Logging
std::shared_ptr<spdlog::logger> setup_logging(const std::string& level);

// Case-insensitive; unknown names fall back to warn instead of off
spdlog::level::level_enum parse_log_level(const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
bool has_env_var(const std::string& name);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool is_truthy(const std::string& value);

// Whole-string decimal integer, nullopt on junk or overflow
std::optional<int> to_int(const std::string& value);

// Filesystem
std::string home_directory();

}
