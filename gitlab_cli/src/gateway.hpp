#pragma once
#include "api_client.hpp"
#include "argument_translator.hpp"
#include "command_registry.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

struct GlobalOptions {
    bool all = false;
    bool verbose = false;
    bool quiet = false;
    bool pretty = false;
    std::vector<std::string> tokens;
};

// Turns one command line into one API call and prints the result
class CliGateway {
public:
    using ConfigLoader = std::function<Config()>;
    using ClientFactory = std::function<std::unique_ptr<ApiClient>(const Config&)>;

    CliGateway(std::shared_ptr<spdlog::logger> logger,
               ConfigLoader config_loader,
               ClientFactory client_factory,
               ArgumentTranslator::ConfigureHandler configure_handler);

    // Returns the process exit code
    int run(const GlobalOptions& options, std::ostream& out);

    const CommandRegistry& registry() const { return registry_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    ConfigLoader config_loader_;
    ClientFactory client_factory_;
    ArgumentTranslator translator_;
    CommandRegistry registry_;
};
