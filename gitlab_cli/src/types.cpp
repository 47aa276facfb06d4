#include "types.hpp"

std::string param_to_string(const ParamValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "1" : "0";
    }
    return std::to_string(std::get<int64_t>(value));
}

nlohmann::json param_to_json(const ParamValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

nlohmann::json params_to_json(const ParamMap& params) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : params) {
        j[key] = param_to_json(value);
    }
    return j;
}

nlohmann::json CallDescriptor::to_json() const {
    return nlohmann::json{
        {"method", method},
        {"positional_args", positional_args},
        {"params", params_to_json(params)}
    };
}

std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DEL: return "DELETE";
    }
    return "GET";
}

std::string to_string(AccessLevel level) {
    switch (level) {
        case AccessLevel::GUEST: return "guest";
        case AccessLevel::REPORTER: return "reporter";
        case AccessLevel::DEVELOPER: return "developer";
        case AccessLevel::MASTER: return "master";
        case AccessLevel::OWNER: return "owner";
    }
    return "guest";
}
