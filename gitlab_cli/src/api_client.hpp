#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct Page {
    nlohmann::json items = nlohmann::json::array();
    std::optional<int> next_page;
};

// Seam between command handlers and the HTTP transport
class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual nlohmann::json request(HttpMethod method, const std::string& path,
                                   const ParamMap& params) = 0;

    virtual Page fetch_page(const std::string& path, const ParamMap& params, int page) = 0;
};
