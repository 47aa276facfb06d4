#include "argument_translator.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <regex>

ArgumentTranslator::ArgumentTranslator(ConfigureHandler configure_handler)
    : configure_handler_(std::move(configure_handler)) {}

std::optional<CallDescriptor> ArgumentTranslator::translate(const std::vector<std::string>& tokens,
                                                            bool fetch_all) const {
    CallDescriptor descriptor;

    for (const auto& token : tokens) {
        if (auto level = match_access_level(token)) {
            descriptor.params["access_level"] = static_cast<int64_t>(*level);
            continue;
        }

        if (parse_flag(token, descriptor.params)) {
            continue;
        }

        descriptor.positional_args.push_back(token);
    }

    if (descriptor.positional_args.empty() || descriptor.positional_args.front().empty()) {
        throw UsageError("No method given. Usage: gitlab <method> [<arg> ...] [--<param>=<value> ...]");
    }

    descriptor.method = normalize_name(descriptor.positional_args.front());
    descriptor.positional_args.erase(descriptor.positional_args.begin());

    if (descriptor.method == CONFIGURE_METHOD) {
        if (configure_handler_) {
            configure_handler_();
        }
        return std::nullopt;
    }

    if (fetch_all) {
        descriptor.positional_args.insert(descriptor.positional_args.begin(), descriptor.method);
        descriptor.method = PAGINATOR_METHOD;
    }

    return descriptor;
}

std::string ArgumentTranslator::normalize_name(const std::string& name) {
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    return normalized;
}

std::optional<AccessLevel> ArgumentTranslator::match_access_level(const std::string& token) {
    if (token == "--guest") return AccessLevel::GUEST;
    if (token == "--reporter") return AccessLevel::REPORTER;
    if (token == "--developer") return AccessLevel::DEVELOPER;
    if (token == "--master") return AccessLevel::MASTER;
    if (token == "--owner") return AccessLevel::OWNER;
    return std::nullopt;
}

bool ArgumentTranslator::parse_flag(const std::string& token, ParamMap& params) {
    // --[no-]<key>[=<value>]
    static const std::regex flag_regex("^--(no-)?([^=]+)(=(.*))?$");

    std::smatch match;
    if (!std::regex_match(token, match, flag_regex)) {
        return false;
    }

    bool negated = match[1].matched;
    bool has_value = match[3].matched;

    if (has_value) {
        // With an explicit value the no- prefix belongs to the key
        std::string key = negated ? "no-" + match[2].str() : match[2].str();
        params[normalize_name(key)] = match[4].str();
    } else {
        params[normalize_name(match[2].str())] = !negated;
    }

    return true;
}
