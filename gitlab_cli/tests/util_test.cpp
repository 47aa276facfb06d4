#include "util.hpp"
#include "types.hpp"
#include <gtest/gtest.h>

TEST(UtilTest, Truthy) {
    for (const char* value : {"1", "true", "TRUE", " yes ", "On"}) {
        EXPECT_TRUE(util::is_truthy(value)) << value;
    }
    for (const char* value : {"0", "false", "", "nope", "2"}) {
        EXPECT_FALSE(util::is_truthy(value)) << value;
    }
}

TEST(UtilTest, Trim) {
    EXPECT_EQ(util::trim("  a b \r\n"), "a b");
    EXPECT_EQ(util::trim(" \t "), "");
}

TEST(UtilTest, LoggerUsesRequestedLevel) {
    auto logger = util::setup_logging("debug");
    EXPECT_EQ(logger->name(), "gitlab");
    EXPECT_EQ(logger->level(), spdlog::level::debug);

    EXPECT_EQ(util::setup_logging("critical")->level(), spdlog::level::critical);
}

TEST(UtilTest, LogLevelNamesAreCaseInsensitive) {
    EXPECT_EQ(util::parse_log_level("WARN"), spdlog::level::warn);
    EXPECT_EQ(util::parse_log_level(" Debug "), spdlog::level::debug);
    EXPECT_EQ(util::parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(util::parse_log_level("off"), spdlog::level::off);
}

TEST(UtilTest, UnknownLogLevelKeepsFatalErrorsVisible) {
    for (const char* name : {"fatal", "verbose", ""}) {
        EXPECT_EQ(util::parse_log_level(name), spdlog::level::warn) << name;

        auto logger = util::setup_logging(name);
        EXPECT_TRUE(logger->should_log(spdlog::level::critical)) << name;
    }
}

TEST(UtilTest, ToIntRequiresWholeString) {
    EXPECT_EQ(util::to_int("42"), 42);
    EXPECT_EQ(util::to_int("-3"), -3);
    EXPECT_FALSE(util::to_int("3x"));
    EXPECT_FALSE(util::to_int("2abc"));
    EXPECT_FALSE(util::to_int(""));
    EXPECT_FALSE(util::to_int("99999999999"));
}

TEST(TypesTest, ParamEncodings) {
    EXPECT_EQ(param_to_string(ParamValue{std::string("x")}), "x");
    EXPECT_EQ(param_to_string(ParamValue{true}), "1");
    EXPECT_EQ(param_to_string(ParamValue{false}), "0");
    EXPECT_EQ(param_to_string(ParamValue{int64_t{40}}), "40");

    EXPECT_EQ(param_to_json(ParamValue{std::string("10")}), nlohmann::json("10"));
    EXPECT_EQ(param_to_json(ParamValue{false}), nlohmann::json(false));
    EXPECT_EQ(param_to_json(ParamValue{int64_t{40}}), nlohmann::json(40));
}

TEST(TypesTest, DescriptorToJson) {
    CallDescriptor descriptor{"project", {"42"}, {{"per_page", std::string("10")}}};
    EXPECT_EQ(descriptor.to_json(), (nlohmann::json{
        {"method", "project"},
        {"positional_args", {"42"}},
        {"params", {{"per_page", "10"}}}
    }));
}

TEST(TypesTest, Names) {
    EXPECT_EQ(to_string(HttpMethod::DEL), "DELETE");
    EXPECT_EQ(to_string(AccessLevel::MASTER), "master");
    EXPECT_EQ(static_cast<int64_t>(AccessLevel::OWNER), 50);
}
