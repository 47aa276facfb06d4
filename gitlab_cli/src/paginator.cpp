#include "paginator.hpp"
#include "errors.hpp"
#include "util.hpp"

Paginator::Paginator(ApiClient& client, std::string path, ParamMap params)
    : client_(&client), path_(std::move(path)), params_(std::move(params)), next_(1) {
    auto it = params_.find("page");
    if (it != params_.end()) {
        std::string start = param_to_string(it->second);
        next_ = util::to_int(start);
        if (!next_) {
            throw UsageError("page must be a number, got '" + start + "'");
        }
        if (*next_ < 1) {
            throw UsageError("page must be at least 1");
        }
        params_.erase(it);
    }
}

std::optional<nlohmann::json> Paginator::next_page() {
    if (!next_) {
        return std::nullopt;
    }

    int current = *next_;
    Page page = client_->fetch_page(path_, params_, current);
    ++pages_fetched_;

    // Only follow a next page that moves forward
    if (page.next_page && *page.next_page > current) {
        next_ = page.next_page;
    } else {
        next_.reset();
    }

    return std::move(page.items);
}

nlohmann::json Paginator::collect() {
    nlohmann::json all = nlohmann::json::array();
    while (auto items = next_page()) {
        for (auto& item : *items) {
            all.push_back(std::move(item));
        }
    }
    return all;
}
