#pragma once
#include "config.hpp"
#include <istream>
#include <ostream>
#include <string>

// Interactive setup behind "gitlab configure"
class ConfigureWizard {
public:
    ConfigureWizard(std::istream& in, std::ostream& out);

    // Prompts starting from current, saves to current.config_path and
    // returns what was written. Throws ConfigError.
    Config run(const Config& current);

private:
    std::istream& in_;
    std::ostream& out_;

    std::string ask(const std::string& question, const std::string& current, bool secret = false);
    bool ask_yes_no(const std::string& question, bool current);
};
