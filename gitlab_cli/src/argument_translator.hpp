#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

class ArgumentTranslator {
public:
    using ConfigureHandler = std::function<void()>;

    static constexpr const char* CONFIGURE_METHOD = "configure";
    static constexpr const char* PAGINATOR_METHOD = "paginator";

    explicit ArgumentTranslator(ConfigureHandler configure_handler);

    // Returns no descriptor when the method was "configure" and the
    // configure handler ran instead. Throws UsageError without a method.
    std::optional<CallDescriptor> translate(const std::vector<std::string>& tokens,
                                            bool fetch_all) const;

    static std::string normalize_name(const std::string& name);
    static std::optional<AccessLevel> match_access_level(const std::string& token);

private:
    ConfigureHandler configure_handler_;

    static bool parse_flag(const std::string& token, ParamMap& params);
};
