#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using ParamValue = std::variant<std::string, bool, int64_t>;
using ParamMap = std::map<std::string, ParamValue>;

// GitLab permission tiers, values as the API expects them
enum class AccessLevel : int64_t {
    GUEST = 10,
    REPORTER = 20,
    DEVELOPER = 30,
    MASTER = 40,
    OWNER = 50
};

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DEL
};

struct CallDescriptor {
    std::string method;
    std::vector<std::string> positional_args;
    ParamMap params;

    nlohmann::json to_json() const;
};

// Query-string form: strings as-is, booleans as 1/0, integers in decimal
std::string param_to_string(const ParamValue& value);

// JSON body form: strings, booleans and integers keep their JSON type
nlohmann::json param_to_json(const ParamValue& value);

nlohmann::json params_to_json(const ParamMap& params);

std::string to_string(HttpMethod method);
std::string to_string(AccessLevel level);
