#pragma once
#include "command_registry.hpp"

// Registers the GitLab v4 endpoints the CLI knows about
void register_gitlab_commands(CommandRegistry& registry);
