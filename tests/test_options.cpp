/**
 * @file test_options.cpp
 * @brief Tests for patch options and their layered loading
 */

#include <gtest/gtest.h>
#include "patcher/Options.hpp"
#include "patcher/Errors.hpp"
#include "test_helpers.hpp"

using namespace patcher;
using fixtures::ScopedEnvVar;
using fixtures::TempFile;

TEST(PatchOptions, Defaults) {
    PatchOptions opts;

    EXPECT_TRUE(opts.ignore_case);
    EXPECT_FALSE(opts.ignore_unknown_properties);
    EXPECT_FALSE(opts.validate_before_write);
}

TEST(PatchOptions, FromValuePartial) {
    auto opts = PatchOptions::from_value({{"ignore_case", false}});

    EXPECT_FALSE(opts.ignore_case);
    EXPECT_FALSE(opts.ignore_unknown_properties);
}

TEST(PatchOptions, FromValueRejectsUnknownKey) {
    EXPECT_THROW(PatchOptions::from_value({{"ignore_kase", true}}), ConfigError);
}

TEST(PatchOptions, FromValueRejectsNonBoolean) {
    EXPECT_THROW(PatchOptions::from_value({{"ignore_case", "yes"}}), ConfigError);
    EXPECT_THROW(PatchOptions::from_value({{"ignore_case", 1}}), ConfigError);
}

TEST(PatchOptions, FromValueRejectsNonObject) {
    EXPECT_THROW(PatchOptions::from_value(Value::array()), ConfigError);
}

TEST(PatchOptions, ToValueCoversAllKeys) {
    Value v = PatchOptions{}.to_value();

    ASSERT_EQ(v.size(), option_keys().size());
    for (const auto& key : option_keys()) {
        EXPECT_TRUE(v.contains(key)) << key;
    }
    EXPECT_EQ(v["ignore_case"], true);
}

TEST(CollectEnvOptions, TypedValues) {
    ScopedEnvVar a("PATCHTEST_IGNORE_CASE", "false");
    ScopedEnvVar b("PATCHTEST_IGNORE_UNKNOWN_PROPERTIES", "TRUE");

    Value env = collect_env_options("PatchTest");

    EXPECT_EQ(env["ignore_case"], false);
    EXPECT_EQ(env["ignore_unknown_properties"], true);
    EXPECT_FALSE(env.contains("validate_before_write"));
}

TEST(ReadOptionsFile, PatchTable) {
    TempFile file(R"(
[patch]
ignore_case = false

[other]
anything = 1
)", ".toml");

    Value v = read_options_file(file.path());

    EXPECT_EQ(v, (Value{{"ignore_case", false}}));
}

TEST(ReadOptionsFile, RootObject) {
    TempFile file(R"({"ignore_unknown_properties": true})");

    Value v = read_options_file(file.path());

    EXPECT_EQ(v["ignore_unknown_properties"], true);
}

TEST(LoadOptions, NoSources) {
    auto opts = load_options(OptionSources{});

    EXPECT_TRUE(opts.ignore_case);
    EXPECT_FALSE(opts.ignore_unknown_properties);
}

TEST(LoadOptions, Precedence) {
    TempFile file(R"({"patch": {"ignore_case": false, "ignore_unknown_properties": true}})");
    ScopedEnvVar env("PATCHPREC_IGNORE_UNKNOWN_PROPERTIES", "false");

    OptionSources sources;
    sources.defaults = {{"validate_before_write", true}};
    sources.file_path = file.path();
    sources.env_prefix = "PATCHPREC";

    auto opts = load_options(sources);
    EXPECT_FALSE(opts.ignore_case);                 // file
    EXPECT_FALSE(opts.ignore_unknown_properties);   // env over file
    EXPECT_TRUE(opts.validate_before_write);        // defaults

    sources.overrides["ignore_case"] = true;
    opts = load_options(sources);
    EXPECT_TRUE(opts.ignore_case);                  // overrides over file
}

TEST(LoadOptions, BadEnvValue) {
    ScopedEnvVar env("PATCHBAD_IGNORE_CASE", "sometimes");

    OptionSources sources;
    sources.env_prefix = "PATCHBAD";

    EXPECT_THROW(load_options(sources), ConfigError);
}

TEST(LoadOptions, MissingFile) {
    OptionSources sources;
    sources.file_path = "/nonexistent/options.toml";

    EXPECT_THROW(load_options(sources), FileNotFoundError);
}
