#include "gitlab_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <chrono>

class GitlabClient::Impl {
public:
    Impl(const Config& config, std::shared_ptr<spdlog::logger> logger)
        : config_(config), logger_(std::move(logger)) {
        std::string base = config_.gitlab_url;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        api_base_url_ = base + "/api/v4";
    }

    nlohmann::json request(HttpMethod method, const std::string& path, const ParamMap& params) {
        auto response = send(method, path, params);
        return parse_body(response);
    }

    Page fetch_page(const std::string& path, const ParamMap& params, int page) {
        ParamMap page_params = params;
        page_params["page"] = static_cast<int64_t>(page);
        if (page_params.find("per_page") == page_params.end()) {
            page_params["per_page"] = static_cast<int64_t>(config_.per_page);
        }

        auto response = send(HttpMethod::GET, path, page_params);

        Page result;
        result.items = parse_body(response);
        if (!result.items.is_array()) {
            throw ApiError(static_cast<int>(response.status_code),
                           fmt::format("Expected a list from {}, got {}", path, result.items.type_name()));
        }

        auto it = response.header.find("X-Next-Page");
        if (it != response.header.end() && !util::trim(it->second).empty()) {
            result.next_page = util::to_int(util::trim(it->second));
            if (!result.next_page) {
                logger_->warn("Ignoring malformed X-Next-Page header '{}'", it->second);
            }
        }

        logger_->debug("Fetched page {} of {} ({} items)", page, path, result.items.size());
        return result;
    }

    const std::string& api_base_url() const {
        return api_base_url_;
    }

private:
    cpr::Response send(HttpMethod method, const std::string& path, const ParamMap& params) {
        std::string url = api_base_url_ + path;

        cpr::Session session;
        session.SetUrl(cpr::Url{url});
        session.SetTimeout(cpr::Timeout{std::chrono::seconds{config_.timeout_seconds}});
        session.SetVerifySsl(cpr::VerifySsl{config_.ssl_verify});

        cpr::Header header{
            {"PRIVATE-TOKEN", config_.private_token},
            {"User-Agent", std::string("gitlab-cli/") + GITLAB_CLI_VERSION},
            {"Accept", "application/json"}
        };

        if (method == HttpMethod::GET || method == HttpMethod::DEL) {
            cpr::Parameters query;
            for (const auto& [key, value] : params) {
                query.Add(cpr::Parameter{key, param_to_string(value)});
            }
            session.SetParameters(query);
        } else {
            header["Content-Type"] = "application/json";
            session.SetBody(cpr::Body{params_to_json(params).dump()});
        }
        session.SetHeader(header);

        logger_->debug("{} {}", to_string(method), url);

        cpr::Response response;
        switch (method) {
            case HttpMethod::GET: response = session.Get(); break;
            case HttpMethod::POST: response = session.Post(); break;
            case HttpMethod::PUT: response = session.Put(); break;
            case HttpMethod::DEL: response = session.Delete(); break;
        }

        if (response.error) {
            throw ApiError(0, fmt::format("Request to {} failed: {}", url, response.error.message));
        }

        logger_->debug("HTTP {} from {}", response.status_code, url);

        if (response.status_code >= 400) {
            throw ApiError(static_cast<int>(response.status_code),
                           fmt::format("HTTP {} from {} {}: {}", response.status_code,
                                       to_string(method), path, error_message(response.text)));
        }

        return response;
    }

    nlohmann::json parse_body(const cpr::Response& response) {
        if (response.text.empty()) {
            return true;
        }

        try {
            return nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ApiError(static_cast<int>(response.status_code),
                           fmt::format("Invalid JSON in response: {}", e.what()));
        }
    }

    static std::string error_message(const std::string& body) {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return body;
        }

        for (const char* field : {"message", "error"}) {
            if (j.contains(field)) {
                const auto& value = j[field];
                return value.is_string() ? value.get<std::string>() : value.dump();
            }
        }

        return body;
    }

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string api_base_url_;
};

// Public interface implementation
GitlabClient::GitlabClient(const Config& config, std::shared_ptr<spdlog::logger> logger)
    : pImpl_(std::make_unique<Impl>(config, std::move(logger))) {}

GitlabClient::~GitlabClient() = default;

nlohmann::json GitlabClient::request(HttpMethod method, const std::string& path, const ParamMap& params) {
    return pImpl_->request(method, path, params);
}

Page GitlabClient::fetch_page(const std::string& path, const ParamMap& params, int page) {
    return pImpl_->fetch_page(path, params, page);
}

const std::string& GitlabClient::api_base_url() const {
    return pImpl_->api_base_url();
}
