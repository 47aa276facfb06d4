#include "util.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace util {

std::shared_ptr<spdlog::logger> setup_logging(const std::string& level) {
    // stdout carries the JSON result, so logs go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("gitlab", console_sink);

    logger->set_level(parse_log_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& level) {
    std::string name = to_lower(trim(level));
    if (name == "warning") name = "warn";

    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        return spdlog::level::warn;
    }
    return parsed;
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

bool has_env_var(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

bool is_truthy(const std::string& value) {
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<int> to_int(const std::string& value) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (!home || std::string(home).empty()) {
        throw std::runtime_error("HOME is not set");
    }
    return std::string(home);
}

}
