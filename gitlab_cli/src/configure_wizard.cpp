#include "configure_wizard.hpp"
#include "errors.hpp"
#include "util.hpp"

ConfigureWizard::ConfigureWizard(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

Config ConfigureWizard::run(const Config& current) {
    if (current.config_path.empty()) {
        throw ConfigError("No config file path to write");
    }

    out_ << "Configuring gitlab-cli (" << current.config_path << ")\n";

    Config updated = current;
    updated.gitlab_url = ask("GitLab URL", current.gitlab_url);
    updated.private_token = ask("Private token", current.private_token, true);
    updated.ssl_verify = ask_yes_no("Verify SSL certificates?", current.ssl_verify);

    while (!updated.gitlab_url.empty() && updated.gitlab_url.back() == '/') {
        updated.gitlab_url.pop_back();
    }

    if (updated.gitlab_url.empty()) {
        throw ConfigError("A GitLab URL is required");
    }
    if (updated.private_token.empty()) {
        throw ConfigError("A private token is required");
    }
    if (!util::starts_with(updated.gitlab_url, "http://") && !util::starts_with(updated.gitlab_url, "https://")) {
        throw ConfigError("GitLab URL must start with http:// or https://");
    }

    updated.save(updated.config_path);
    out_ << "Saved " << updated.config_path << "\n";

    return updated;
}

std::string ConfigureWizard::ask(const std::string& question, const std::string& current, bool secret) {
    out_ << question;
    if (!current.empty()) {
        out_ << " [" << (secret ? std::string("********") : current) << "]";
    }
    out_ << ": " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        return current;
    }

    answer = util::trim(answer);
    return answer.empty() ? current : answer;
}

bool ConfigureWizard::ask_yes_no(const std::string& question, bool current) {
    std::string answer = ask(question + (current ? " [Y/n]" : " [y/N]"), "");
    if (answer.empty()) {
        return current;
    }
    return util::is_truthy(answer) || util::to_lower(answer) == "y";
}
