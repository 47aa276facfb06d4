#pragma once
#include "api_client.hpp"
#include "errors.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Records every call and answers from canned data
class FakeApiClient : public ApiClient {
public:
    struct Call {
        HttpMethod method;
        std::string path;
        ParamMap params;
        int page = 0;
    };

    nlohmann::json response = nlohmann::json::object();
    std::map<int, Page> pages;
    std::optional<ApiError> failure;
    std::vector<Call> calls;

    nlohmann::json request(HttpMethod method, const std::string& path, const ParamMap& params) override {
        calls.push_back({method, path, params, 0});
        if (failure) {
            throw *failure;
        }
        return response;
    }

    Page fetch_page(const std::string& path, const ParamMap& params, int page) override {
        calls.push_back({HttpMethod::GET, path, params, page});
        if (failure) {
            throw *failure;
        }
        auto it = pages.find(page);
        if (it == pages.end()) {
            return Page{};
        }
        return it->second;
    }
};
