#include "output.hpp"

namespace output {

std::string format_json(const nlohmann::json& document, bool pretty) {
    return document.dump(pretty ? PRETTY_INDENT : -1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
}

void print_result(std::ostream& out, CommandResult& result, bool pretty) {
    nlohmann::json document;
    if (auto* paginator = std::get_if<Paginator>(&result)) {
        document = paginator->collect();
    } else {
        document = std::move(std::get<nlohmann::json>(result));
    }

    out << format_json(document, pretty) << '\n';
    out.flush();
}

}
