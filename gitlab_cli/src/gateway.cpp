#include "gateway.hpp"
#include "errors.hpp"
#include "gitlab_commands.hpp"
#include "output.hpp"

CliGateway::CliGateway(std::shared_ptr<spdlog::logger> logger,
                       ConfigLoader config_loader,
                       ClientFactory client_factory,
                       ArgumentTranslator::ConfigureHandler configure_handler)
    : logger_(std::move(logger))
    , config_loader_(std::move(config_loader))
    , client_factory_(std::move(client_factory))
    , translator_(std::move(configure_handler)) {
    register_gitlab_commands(registry_);
}

int CliGateway::run(const GlobalOptions& options, std::ostream& out) {
    try {
        auto descriptor = translator_.translate(options.tokens, options.all);
        if (!descriptor) {
            logger_->debug("Configuration finished");
            return 0;
        }

        logger_->debug("Dispatching {}", descriptor->to_json().dump());

        if (!registry_.contains(descriptor->method)) {
            throw UnknownCommandError(descriptor->method);
        }

        Config config = config_loader_();
        config.validate();

        auto client = client_factory_(config);
        auto result = registry_.dispatch(*client, *descriptor);
        if (const auto* paginator = std::get_if<Paginator>(&result)) {
            logger_->debug("Collecting every page of {}", paginator->path());
        }

        output::print_result(out, result, options.pretty || config.pretty_json);
        return 0;

    } catch (const std::exception& e) {
        logger_->critical("{}", e.what());
        return 1;
    }
}
