#pragma once
#include "command_registry.hpp"
#include "gateway.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

// Registers -a/-v/-q/-p and --version on app, bound to options. Anything
// else on the command line is left for the translator.
void add_global_options(CLI::App& app, GlobalOptions& options, const CommandRegistry& registry);

// Every token CLI11 does not consume, plus "--" and everything after it,
// lands in options.tokens in command-line order. Throws CLI::ParseError,
// and CLI::Success after --help or --version.
void parse_command_line(CLI::App& app, GlobalOptions& options, int argc, const char* const* argv);

// -v beats -q; nullopt leaves the configured level alone
std::optional<spdlog::level::level_enum> log_level_override(const GlobalOptions& options);

std::string access_level_help();

// The whole program behind main(). Results, help and version go to out,
// wizard prompts to prompts. Every failure is logged through logger.
int run_cli(int argc, const char* const* argv, std::shared_ptr<spdlog::logger> logger,
            std::istream& in, std::ostream& out, std::ostream& prompts);
