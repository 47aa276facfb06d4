#include "cli.hpp"
#include "config.hpp"
#include "configure_wizard.hpp"
#include "errors.hpp"
#include "gitlab_client.hpp"
#include "types.hpp"
#include "util.hpp"
#include <fmt/format.h>

void add_global_options(CLI::App& app, GlobalOptions& options, const CommandRegistry& registry) {
    app.set_version_flag("--version", GITLAB_CLI_VERSION);
    app.allow_extras();

    app.add_flag("-a,--all", options.all, "Fetch every page of a list command");
    app.add_flag("-v,--verbose", options.verbose, "Log requests and responses");
    app.add_flag("-q,--quiet", options.quiet, "Only log fatal errors");
    app.add_flag("-p,--pretty", options.pretty, "Pretty-print the JSON output");

    app.usage("Usage: gitlab [OPTIONS] <method> [<arg> ...] [--<param>=<value> ...]\n"
              "       gitlab configure");
    app.footer(access_level_help() + "\n" +
               "Set GITLAB_PRETTY_JSON=1 to always pretty-print.\n\n" +
               registry.help_text());
}

void parse_command_line(CLI::App& app, GlobalOptions& options, int argc, const char* const* argv) {
    // CLI11 swallows "--", the translator treats it as a positional
    int split = argc;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--") {
            split = i;
            break;
        }
    }

    app.parse(split, argv);

    options.tokens = app.remaining();
    options.tokens.insert(options.tokens.end(), argv + split, argv + argc);
}

std::optional<spdlog::level::level_enum> log_level_override(const GlobalOptions& options) {
    if (options.verbose) {
        return spdlog::level::debug;
    }
    if (options.quiet) {
        return spdlog::level::critical;
    }
    return std::nullopt;
}

std::string access_level_help() {
    std::string text = "Access levels:";
    for (auto level : {AccessLevel::GUEST, AccessLevel::REPORTER, AccessLevel::DEVELOPER,
                       AccessLevel::MASTER, AccessLevel::OWNER}) {
        text += fmt::format(" --{} ({})", to_string(level), static_cast<int64_t>(level));
    }
    return text;
}

int run_cli(int argc, const char* const* argv, std::shared_ptr<spdlog::logger> logger,
            std::istream& in, std::ostream& out, std::ostream& prompts) {
    try {
        GlobalOptions options;

        CliGateway gateway(
            logger,
            [&logger, &options]() {
                Config config = Config::load();
                if (!log_level_override(options)) {
                    logger->set_level(util::parse_log_level(config.log_level));
                }
                return config;
            },
            [&logger](const Config& config) -> std::unique_ptr<ApiClient> {
                return std::make_unique<GitlabClient>(config, logger);
            },
            [&logger, &in, &prompts]() {
                // Environment overrides must not end up in the file
                Config current;
                try {
                    current = Config::load_file_only();
                } catch (const ConfigError& e) {
                    logger->warn("Starting from defaults, current configuration is unusable: {}", e.what());
                    current = Config{};
                    current.config_path = Config::default_config_path();
                }
                ConfigureWizard wizard(in, prompts);
                wizard.run(current);
            });

        CLI::App app{"gitlab - command-line gateway to the GitLab API"};
        add_global_options(app, options, gateway.registry());

        try {
            parse_command_line(app, options, argc, argv);
        } catch (const CLI::Success& e) {
            return app.exit(e, out, prompts);
        } catch (const CLI::ParseError& e) {
            logger->critical("{}", e.what());
            return 1;
        }

        if (auto level = log_level_override(options)) {
            logger->set_level(*level);
        }

        return gateway.run(options, out);

    } catch (const std::exception& e) {
        logger->critical("Fatal error: {}", e.what());
        return 1;
    }
}
