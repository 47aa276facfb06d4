#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string read_secret_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot read secret file " + path);
    }
    std::string content;
    std::getline(file, content);
    return util::trim(content);
}

int parse_int(const std::string& name, const std::string& value) {
    auto result = util::to_int(util::trim(value));
    if (!result) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    return *result;
}

}

std::string Config::default_config_path() {
    if (util::has_env_var("GITLAB_CLI_CONFIG")) {
        return util::get_env_var("GITLAB_CLI_CONFIG");
    }
    return (fs::path(util::home_directory()) / ".gitlab-cli.json").string();
}

Config Config::load() {
    Config config = load_file_only();
    config.apply_env();
    return config;
}

Config Config::load_file_only() {
    Config config;
    config.config_path = default_config_path();

    if (fs::exists(config.config_path)) {
        config.apply_file(config.config_path);
    }

    return config;
}

void Config::apply_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Config file " + path + " must hold a JSON object");
    }

    try {
        gitlab_url = j.value("url", gitlab_url);
        private_token = j.value("private_token", private_token);
        ssl_verify = j.value("ssl_verify", ssl_verify);
        timeout_seconds = j.value("timeout", timeout_seconds);
        per_page = j.value("per_page", per_page);
        pretty_json = j.value("pretty_json", pretty_json);
        log_level = j.value("log_level", log_level);
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError("Invalid value in config file " + path + ": " + e.what());
    }
}

void Config::apply_env() {
    gitlab_url = util::get_env_var("GITLAB_URL", gitlab_url);

    if (util::has_env_var("GITLAB_PRIVATE_TOKEN_FILE")) {
        private_token = read_secret_file(util::get_env_var("GITLAB_PRIVATE_TOKEN_FILE"));
    } else {
        private_token = util::get_env_var("GITLAB_PRIVATE_TOKEN", private_token);
    }

    if (util::has_env_var("GITLAB_SSL_VERIFY")) {
        ssl_verify = util::is_truthy(util::get_env_var("GITLAB_SSL_VERIFY"));
    }
    if (util::has_env_var("GITLAB_TIMEOUT")) {
        timeout_seconds = parse_int("GITLAB_TIMEOUT", util::get_env_var("GITLAB_TIMEOUT"));
    }
    if (util::has_env_var("GITLAB_PER_PAGE")) {
        per_page = parse_int("GITLAB_PER_PAGE", util::get_env_var("GITLAB_PER_PAGE"));
    }
    if (util::has_env_var("GITLAB_PRETTY_JSON")) {
        pretty_json = util::is_truthy(util::get_env_var("GITLAB_PRETTY_JSON"));
    }

    log_level = util::get_env_var("LOG_LEVEL", log_level);
}

void Config::save(const std::string& path) const {
    nlohmann::json j = {
        {"url", gitlab_url},
        {"private_token", private_token},
        {"ssl_verify", ssl_verify},
        {"timeout", timeout_seconds},
        {"per_page", per_page},
        {"pretty_json", pretty_json},
        {"log_level", log_level}
    };

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ConfigError("Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            throw ConfigError("Cannot write config file " + path);
        }
        file << j.dump(4) << '\n';
        if (!file) {
            throw ConfigError("Failed writing config file " + path);
        }
    }

    // The file holds a token
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw ConfigError("Cannot restrict permissions on " + path + ": " + ec.message());
    }
}

void Config::validate() const {
    if (gitlab_url.empty()) {
        throw ConfigError("GitLab URL is required (run 'gitlab configure' or set GITLAB_URL)");
    }

    if (!util::starts_with(gitlab_url, "http://") && !util::starts_with(gitlab_url, "https://")) {
        throw ConfigError("GitLab URL must start with http:// or https://");
    }

    if (private_token.empty()) {
        throw ConfigError("Private token is required (run 'gitlab configure' or set GITLAB_PRIVATE_TOKEN)");
    }

    if (per_page < 1 || per_page > 100) {
        throw ConfigError("per_page must be between 1 and 100");
    }

    if (timeout_seconds <= 0) {
        throw ConfigError("timeout must be positive");
    }
}
