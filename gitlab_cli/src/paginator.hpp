#pragma once
#include "api_client.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Lazily walks every page of a GitLab listing. Nothing is requested until
// next_page() or collect() is called.
class Paginator {
public:
    Paginator(ApiClient& client, std::string path, ParamMap params);

    std::optional<nlohmann::json> next_page();
    nlohmann::json collect();

    const std::string& path() const { return path_; }
    int pages_fetched() const { return pages_fetched_; }
    bool exhausted() const { return !next_.has_value(); }

private:
    ApiClient* client_;
    std::string path_;
    ParamMap params_;
    std::optional<int> next_;
    int pages_fetched_ = 0;
};
