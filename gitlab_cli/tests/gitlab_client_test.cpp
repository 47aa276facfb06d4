#include "gitlab_client.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <spdlog/sinks/null_sink.h>
#include <thread>

namespace {

std::shared_ptr<spdlog::logger> quiet_logger() {
    return std::make_shared<spdlog::logger>("gitlab_client_test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

nlohmann::json describe(const httplib::Request& req) {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [key, value] : req.params) {
        params[key] = value;
    }
    return nlohmann::json{
        {"method", req.method},
        {"path", req.path},
        {"params", params},
        {"token", req.get_header_value("PRIVATE-TOKEN")},
        {"user_agent", req.get_header_value("User-Agent")},
        {"content_type", req.get_header_value("Content-Type")},
        {"body", req.body}
    };
}

}

// Serves a fake GitLab API on a local port
class GitlabClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto echo = [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(describe(req).dump(), "application/json");
        };
        server_.Get("/api/v4/echo", echo);
        server_.Post("/api/v4/echo", echo);
        server_.Put("/api/v4/echo", echo);
        server_.Delete("/api/v4/echo", echo);

        server_.Get("/api/v4/items", [](const httplib::Request& req, httplib::Response& res) {
            int page = std::stoi(req.get_param_value("page"));
            nlohmann::json items = nlohmann::json::array();
            if (page == 1) {
                items = {1, 2};
                res.set_header("X-Next-Page", "2");
            } else if (page == 2) {
                items = {3};
                res.set_header("X-Next-Page", "");
            }
            res.set_header("X-Per-Page", req.get_param_value("per_page"));
            res.set_content(items.dump(), "application/json");
        });

        server_.Get("/api/v4/page-echo", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(nlohmann::json::array({describe(req)}).dump(), "application/json");
        });

        server_.Get("/api/v4/junk-next", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("X-Next-Page", "3x");
            res.set_content("[1]", "application/json");
        });

        server_.Delete("/api/v4/projects/7", [](const httplib::Request&, httplib::Response& res) {
            res.status = 204;
        });

        server_.Get("/api/v4/forbidden", [](const httplib::Request&, httplib::Response& res) {
            res.status = 403;
            res.set_content(R"({"message":"403 Forbidden"})", "application/json");
        });

        server_.Post("/api/v4/invalid", [](const httplib::Request&, httplib::Response& res) {
            res.status = 400;
            res.set_content(R"({"message":{"name":["has already been taken"]}})", "application/json");
        });

        server_.Get("/api/v4/plain-error", [](const httplib::Request&, httplib::Response& res) {
            res.status = 502;
            res.set_content("Bad Gateway", "text/plain");
        });

        server_.Get("/api/v4/not-json", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("<html></html>", "text/html");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();

        config_.gitlab_url = "http://127.0.0.1:" + std::to_string(port_) + "/";
        config_.private_token = "secret-token";
        config_.timeout_seconds = 5;
        config_.per_page = 20;
    }

    void TearDown() override {
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    httplib::Server server_;
    std::thread server_thread_;
    int port_ = 0;
    Config config_;
};

TEST_F(GitlabClientTest, BaseUrlDropsTrailingSlash) {
    GitlabClient client(config_, quiet_logger());
    EXPECT_EQ(client.api_base_url(), "http://127.0.0.1:" + std::to_string(port_) + "/api/v4");
}

TEST_F(GitlabClientTest, GetSendsTokenAndQueryParams) {
    GitlabClient client(config_, quiet_logger());
    ParamMap params{{"search", std::string("demo")}, {"archived", false}, {"access_level", int64_t{30}}};

    auto echoed = client.request(HttpMethod::GET, "/echo", params);

    EXPECT_EQ(echoed["method"], "GET");
    EXPECT_EQ(echoed["token"], "secret-token");
    EXPECT_EQ(echoed["user_agent"].get<std::string>().rfind("gitlab-cli/", 0), 0u);
    EXPECT_EQ(echoed["params"]["search"], "demo");
    EXPECT_EQ(echoed["params"]["archived"], "0");
    EXPECT_EQ(echoed["params"]["access_level"], "30");
    EXPECT_EQ(echoed["body"], "");
}

TEST_F(GitlabClientTest, PostSendsJsonBody) {
    GitlabClient client(config_, quiet_logger());
    ParamMap params{{"name", std::string("demo")}, {"visibility", std::string("private")},
                    {"lfs_enabled", true}, {"access_level", int64_t{40}}};

    auto echoed = client.request(HttpMethod::POST, "/echo", params);

    EXPECT_EQ(echoed["method"], "POST");
    EXPECT_EQ(echoed["content_type"], "application/json");
    EXPECT_TRUE(echoed["params"].empty());

    auto body = nlohmann::json::parse(echoed["body"].get<std::string>());
    EXPECT_EQ(body["name"], "demo");
    EXPECT_EQ(body["visibility"], "private");
    EXPECT_EQ(body["lfs_enabled"], true);
    EXPECT_EQ(body["access_level"], 40);
}

TEST_F(GitlabClientTest, PutAndDeleteUseMatchingVerbs) {
    GitlabClient client(config_, quiet_logger());

    EXPECT_EQ(client.request(HttpMethod::PUT, "/echo", {})["method"], "PUT");
    EXPECT_EQ(client.request(HttpMethod::DEL, "/echo", {{"hard", true}})["params"]["hard"], "1");
}

TEST_F(GitlabClientTest, EmptySuccessBodyIsTrue) {
    GitlabClient client(config_, quiet_logger());
    EXPECT_EQ(client.request(HttpMethod::DEL, "/projects/7", {}), nlohmann::json(true));
}

TEST_F(GitlabClientTest, HttpErrorCarriesStatusAndMessage) {
    GitlabClient client(config_, quiet_logger());

    try {
        client.request(HttpMethod::GET, "/forbidden", {});
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 403);
        EXPECT_NE(std::string(e.what()).find("403 Forbidden"), std::string::npos);
    }

    try {
        client.request(HttpMethod::POST, "/invalid", {{"name", std::string("x")}});
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 400);
        EXPECT_NE(std::string(e.what()).find("has already been taken"), std::string::npos);
    }

    try {
        client.request(HttpMethod::GET, "/plain-error", {});
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 502);
        EXPECT_NE(std::string(e.what()).find("Bad Gateway"), std::string::npos);
    }
}

TEST_F(GitlabClientTest, NotFoundIsAnApiError) {
    GitlabClient client(config_, quiet_logger());
    EXPECT_THROW(client.request(HttpMethod::GET, "/no/such/thing", {}), ApiError);
}

TEST_F(GitlabClientTest, NonJsonBodyIsAnApiError) {
    GitlabClient client(config_, quiet_logger());
    EXPECT_THROW(client.request(HttpMethod::GET, "/not-json", {}), ApiError);
}

TEST_F(GitlabClientTest, FetchPageReadsNextPageHeader) {
    GitlabClient client(config_, quiet_logger());

    Page first = client.fetch_page("/items", {}, 1);
    EXPECT_EQ(first.items, nlohmann::json::array({1, 2}));
    ASSERT_TRUE(first.next_page);
    EXPECT_EQ(*first.next_page, 2);

    Page second = client.fetch_page("/items", {}, 2);
    EXPECT_EQ(second.items, nlohmann::json::array({3}));
    EXPECT_FALSE(second.next_page);
}

TEST_F(GitlabClientTest, MalformedNextPageHeaderEndsPaging) {
    GitlabClient client(config_, quiet_logger());

    Page page = client.fetch_page("/junk-next", {}, 1);
    EXPECT_EQ(page.items, nlohmann::json::array({1}));
    EXPECT_FALSE(page.next_page);
}

TEST_F(GitlabClientTest, LongTimeoutIsAccepted) {
    // More milliseconds than an int holds
    config_.timeout_seconds = 3000000;
    GitlabClient client(config_, quiet_logger());

    EXPECT_EQ(client.request(HttpMethod::GET, "/echo", {})["method"], "GET");
}

TEST_F(GitlabClientTest, FetchPageUsesConfiguredPerPageUnlessGiven) {
    GitlabClient client(config_, quiet_logger());

    Page page = client.fetch_page("/page-echo", {{"state", std::string("opened")}}, 3);
    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_EQ(page.items[0]["params"]["page"], "3");
    EXPECT_EQ(page.items[0]["params"]["per_page"], "20");
    EXPECT_EQ(page.items[0]["params"]["state"], "opened");
    EXPECT_FALSE(page.next_page);

    page = client.fetch_page("/page-echo", {{"per_page", std::string("5")}}, 1);
    EXPECT_EQ(page.items[0]["params"]["per_page"], "5");
}

TEST_F(GitlabClientTest, FetchPageRejectsNonListResponses) {
    GitlabClient client(config_, quiet_logger());
    EXPECT_THROW(client.fetch_page("/echo", {}, 1), ApiError);
}

TEST_F(GitlabClientTest, TransportFailureHasStatusZero) {
    // Nothing listens on port 1
    config_.gitlab_url = "http://127.0.0.1:1";
    config_.timeout_seconds = 2;
    GitlabClient client(config_, quiet_logger());

    try {
        client.request(HttpMethod::GET, "/version", {});
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 0);
    }
}
