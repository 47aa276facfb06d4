#pragma once
#include "api_client.hpp"
#include "paginator.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// A plain JSON document, or a lazy sequence of pages under --all
using CommandResult = std::variant<nlohmann::json, Paginator>;

// Declarative description of one REST endpoint. Path segments written as
// ":name" are filled from the positional argument of the same name; the
// remaining arguments are sent as parameters.
struct CommandSpec {
    std::string name;
    HttpMethod method = HttpMethod::GET;
    std::string path;
    std::vector<std::string> arguments;
    bool pageable = false;
    ParamMap fixed_params;
    std::string summary;
};

struct BoundRequest {
    std::string path;
    ParamMap params;
};

class CommandRegistry {
public:
    using Handler = std::function<CommandResult(ApiClient&, const CallDescriptor&)>;

    // Registers the built-in "paginator" handler
    CommandRegistry();

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    void add(const std::string& name, const std::string& summary, Handler handler);
    void add(CommandSpec spec);

    bool contains(const std::string& name) const;
    const CommandSpec* find_spec(const std::string& name) const;
    std::vector<std::string> names() const;
    std::string summary(const std::string& name) const;
    std::string help_text() const;

    // Throws UnknownCommandError for unregistered methods
    CommandResult dispatch(ApiClient& client, const CallDescriptor& descriptor) const;

    static BoundRequest bind(const CommandSpec& spec,
                             const std::vector<std::string>& positional_args,
                             const ParamMap& params);

    static std::vector<std::string> path_placeholders(const std::string& path);

private:
    struct Entry {
        std::string summary;
        Handler handler;
        std::optional<CommandSpec> spec;
    };

    std::map<std::string, Entry> entries_;

    CommandResult paginate(ApiClient& client, const CallDescriptor& descriptor) const;
};
