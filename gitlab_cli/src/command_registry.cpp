#include "command_registry.hpp"
#include "argument_translator.hpp"
#include "errors.hpp"
#include <cpr/util.h>
#include <fmt/format.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;

    while (std::getline(ss, segment, '/')) {
        segments.push_back(segment);
    }

    return segments;
}

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

}

CommandRegistry::CommandRegistry() {
    add(ArgumentTranslator::PAGINATOR_METHOD, "Fetch every page of a list command",
        [this](ApiClient& client, const CallDescriptor& descriptor) {
            return paginate(client, descriptor);
        });
}

void CommandRegistry::add(const std::string& name, const std::string& summary, Handler handler) {
    if (name.empty()) {
        throw std::invalid_argument("Command name must not be empty");
    }
    if (entries_.count(name)) {
        throw std::invalid_argument("Command already registered: " + name);
    }
    entries_[name] = Entry{summary, std::move(handler), std::nullopt};
}

void CommandRegistry::add(CommandSpec spec) {
    for (const auto& placeholder : path_placeholders(spec.path)) {
        if (std::find(spec.arguments.begin(), spec.arguments.end(), placeholder) == spec.arguments.end()) {
            throw std::invalid_argument(
                fmt::format("{}: path placeholder :{} is not a declared argument", spec.name, placeholder));
        }
    }

    std::string name = spec.name;
    std::string summary = spec.summary;
    CommandSpec captured = spec;

    add(name, summary, [captured](ApiClient& client, const CallDescriptor& descriptor) -> CommandResult {
        BoundRequest request = bind(captured, descriptor.positional_args, descriptor.params);
        return client.request(captured.method, request.path, request.params);
    });
    entries_[name].spec = std::move(spec);
}

bool CommandRegistry::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

const CommandSpec* CommandRegistry::find_spec(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end() || !it->second.spec) {
        return nullptr;
    }
    return &*it->second.spec;
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        result.push_back(name);
    }
    return result;
}

std::string CommandRegistry::summary(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw UnknownCommandError(name);
    }
    return it->second.summary;
}

std::string CommandRegistry::help_text() const {
    size_t width = 0;
    for (const auto& [name, entry] : entries_) {
        width = std::max(width, name.size());
    }

    std::string text = "Commands (hyphens and underscores are interchangeable):\n";
    for (const auto& name : names()) {
        std::string args;
        if (const auto* spec = find_spec(name)) {
            for (const auto& arg : spec->arguments) {
                args += " <" + arg + ">";
            }
        }
        text += fmt::format("  {:<{}}  {}{}\n", name, width, summary(name),
                            args.empty() ? "" : " -" + args);
    }
    return text;
}

CommandResult CommandRegistry::dispatch(ApiClient& client, const CallDescriptor& descriptor) const {
    auto it = entries_.find(descriptor.method);
    if (it == entries_.end()) {
        throw UnknownCommandError(descriptor.method);
    }
    return it->second.handler(client, descriptor);
}

BoundRequest CommandRegistry::bind(const CommandSpec& spec,
                                   const std::vector<std::string>& positional_args,
                                   const ParamMap& params) {
    if (positional_args.size() != spec.arguments.size()) {
        throw UsageError(fmt::format("{} expects {} argument(s) ({}), got {}",
                                     spec.name, spec.arguments.size(),
                                     join_names(spec.arguments), positional_args.size()));
    }

    std::map<std::string, std::string> values;
    for (size_t i = 0; i < spec.arguments.size(); ++i) {
        values[spec.arguments[i]] = positional_args[i];
    }

    BoundRequest request;
    request.params = params;

    auto placeholders = path_placeholders(spec.path);
    std::string path;
    for (const auto& segment : split_path(spec.path)) {
        if (segment.empty()) {
            continue;
        }
        path += '/';
        if (segment.front() == ':') {
            auto encoded = cpr::util::urlEncode(values.at(segment.substr(1)));
            path.append(encoded.begin(), encoded.end());
        } else {
            path += segment;
        }
    }
    request.path = path.empty() ? "/" : path;

    for (const auto& [name, value] : values) {
        if (std::find(placeholders.begin(), placeholders.end(), name) != placeholders.end()) {
            continue;
        }
        if (request.params.count(name)) {
            throw UsageError(fmt::format("{}: '{}' given both as argument and as --{}",
                                         spec.name, name, name));
        }
        request.params[name] = value;
    }

    for (const auto& [name, value] : spec.fixed_params) {
        request.params.emplace(name, value);
    }

    return request;
}

std::vector<std::string> CommandRegistry::path_placeholders(const std::string& path) {
    std::vector<std::string> placeholders;
    for (const auto& segment : split_path(path)) {
        if (segment.size() > 1 && segment.front() == ':') {
            placeholders.push_back(segment.substr(1));
        }
    }
    return placeholders;
}

CommandResult CommandRegistry::paginate(ApiClient& client, const CallDescriptor& descriptor) const {
    if (descriptor.positional_args.empty()) {
        throw UsageError("paginator needs the name of a list command");
    }

    std::string target = ArgumentTranslator::normalize_name(descriptor.positional_args.front());
    if (!contains(target)) {
        throw UnknownCommandError(target);
    }

    const CommandSpec* spec = find_spec(target);
    if (!spec || !spec->pageable || spec->method != HttpMethod::GET) {
        throw UsageError(target + " does not return a paged list and cannot be used with --all");
    }

    std::vector<std::string> rest(descriptor.positional_args.begin() + 1, descriptor.positional_args.end());
    BoundRequest request = bind(*spec, rest, descriptor.params);

    return Paginator(client, request.path, request.params);
}
