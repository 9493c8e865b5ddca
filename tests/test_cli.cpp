#include <gtest/gtest.h>
#include <pyresolve/cli.hpp>
#include <string>
#include <vector>

using namespace pyresolve;

TEST(Cli, PythonAndPlatform) {
    ResolverConfig cfg;
    auto opts = parse_args({"--platform", "restricted", "--python", "3.11", "-v"}, cfg);
    EXPECT_FALSE(opts.help);
    EXPECT_EQ(opts.request.value_or(""), "3.11");
    EXPECT_EQ(cfg.platform.value_or(PlatformKind::Standard), PlatformKind::Restricted);
    EXPECT_TRUE(cfg.verbose);
}

TEST(Cli, AutoPlatformResets) {
    ResolverConfig cfg;
    cfg.platform = PlatformKind::Restricted;
    parse_args({"--platform", "auto"}, cfg);
    EXPECT_FALSE(cfg.platform.has_value());
}

TEST(Cli, HelpStopsParsing) {
    ResolverConfig cfg;
    auto opts = parse_args({"--help", "--bogus"}, cfg);
    EXPECT_TRUE(opts.help);
}

TEST(Cli, TrailingOptionRequiresValue) {
    for (std::string opt : {"--python", "--platform"}) {
        ResolverConfig cfg;
        try {
            parse_args({"-v", opt}, cfg);
            ADD_FAILURE() << "expected UsageError for " << opt;
        } catch (const UsageError& e) {
            EXPECT_EQ(std::string(e.what()), "option '" + opt + "' requires a value");
        }
    }
}

TEST(Cli, UnknownPlatformAndArgument) {
    ResolverConfig cfg;
    EXPECT_THROW(parse_args({"--platform", "beos"}, cfg), UsageError);
    try {
        parse_args({"3.11"}, cfg);
        ADD_FAILURE() << "expected UsageError";
    } catch (const UsageError& e) {
        EXPECT_EQ(std::string(e.what()), "unexpected argument '3.11'");
    }
}
