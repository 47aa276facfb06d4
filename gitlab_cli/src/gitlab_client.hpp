#pragma once
#include "api_client.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

class GitlabClient : public ApiClient {
public:
    GitlabClient(const Config& config, std::shared_ptr<spdlog::logger> logger);
    ~GitlabClient() override;

    nlohmann::json request(HttpMethod method, const std::string& path,
                           const ParamMap& params) override;

    Page fetch_page(const std::string& path, const ParamMap& params, int page) override;

    const std::string& api_base_url() const;

    // Non-copyable
    GitlabClient(const GitlabClient&) = delete;
    GitlabClient& operator=(const GitlabClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
