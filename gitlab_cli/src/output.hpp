#pragma once
#include "command_registry.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace output {

constexpr int PRETTY_INDENT = 4;

std::string format_json(const nlohmann::json& document, bool pretty);

// Drains a Paginator result before printing
void print_result(std::ostream& out, CommandResult& result, bool pretty);

}
