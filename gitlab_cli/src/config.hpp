#pragma once
#include <string>

struct Config {
    std::string gitlab_url;
    std::string private_token;
    bool ssl_verify = true;
    int timeout_seconds = 30;
    int per_page = 100;
    bool pretty_json = false;
    std::string log_level = "warn";
    std::string config_path;

    // Defaults, then the config file, then the environment
    static Config load();
    // Defaults and the config file, without environment overrides. This is
    // what "gitlab configure" edits and writes back.
    static Config load_file_only();
    static std::string default_config_path();

    void apply_file(const std::string& path);
    void apply_env();
    void save(const std::string& path) const;
    void validate() const;
};
