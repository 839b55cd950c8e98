#include "confcache/util/configuration.hh"
#include "confcache/util/error.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace confcache {

struct TestSettings : Config
{
    Setting<bool> enabled{this, true, "enabled", "Whether the feature is enabled."};

    Setting<unsigned int> maxProblems{
        this,
        512,
        "max-problems",
        R"(
          The number of problems to tolerate.
        )"};

    Setting<uint64_t> maxSize{this, 1024, "max-size", "The largest size."};
};

TEST(Config, setUnknownSetting)
{
    TestSettings settings;
    ASSERT_FALSE(settings.set("undefined-key", "value"));
}

TEST(Config, setMarksOverridden)
{
    TestSettings settings;
    ASSERT_FALSE(settings.maxProblems.overridden);

    ASSERT_TRUE(settings.set("max-problems", "3"));
    ASSERT_EQ(settings.maxProblems.get(), 3u);
    ASSERT_TRUE(settings.maxProblems.overridden);

    settings.resetOverridden();
    ASSERT_FALSE(settings.maxProblems.overridden);
    ASSERT_EQ(settings.maxProblems.get(), 3u);
}

TEST(Config, booleanSettings)
{
    TestSettings settings;

    ASSERT_TRUE(settings.set("enabled", "false"));
    ASSERT_FALSE(settings.enabled.get());
    ASSERT_TRUE(settings.set("enabled", "yes"));
    ASSERT_TRUE(settings.enabled.get());
    ASSERT_THROW(settings.set("enabled", "maybe"), UsageError);
}

TEST(Config, integerSettingsRejectGarbage)
{
    TestSettings settings;

    ASSERT_THROW(settings.set("max-problems", "lots"), UsageError);
    ASSERT_THROW(settings.set("max-size", "-1"), UsageError);
    ASSERT_EQ(settings.maxProblems.get(), 512u);
}

TEST(Config, assignment)
{
    TestSettings settings;
    settings.maxSize = 4;
    ASSERT_EQ(settings.maxSize.get(), 4u);
    ASSERT_FALSE(settings.maxSize.overridden);
}

TEST(Config, descriptionIsUnindented)
{
    TestSettings settings;
    ASSERT_EQ(settings.maxProblems.description, "\nThe number of problems to tolerate.\n\n");
}

TEST(Config, toJSON)
{
    TestSettings settings;
    settings.set("max-size", "2048");

    auto json = settings.toJSON();
    ASSERT_EQ(json.size(), 3u);
    ASSERT_EQ(json["max-size"]["value"], 2048);
    ASSERT_EQ(json["max-size"]["defaultValue"], 1024);
    ASSERT_EQ(json["enabled"]["value"], true);
    ASSERT_EQ(json["enabled"]["description"], "Whether the feature is enabled.\n");
}

TEST(Config, settingNamesAreUnique)
{
    Config config;
    Setting<bool> first{&config, true, "name", "description"};
    ASSERT_THROW((Setting<bool>{&config, false, "name", "description"}), Error);
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfig)
{
    TestSettings settings;
    settings.applyConfig(
        "# a comment\n"
        "max-problems = 7\n"
        "\n"
        "  enabled=false   # trailing comment\n"
        "unknown-setting = 1\n");

    ASSERT_EQ(settings.maxProblems.get(), 7u);
    ASSERT_FALSE(settings.enabled.get());
    ASSERT_TRUE(settings.enabled.overridden);
}

TEST(Config, applyConfigWithoutTrailingNewline)
{
    TestSettings settings;
    settings.applyConfig("max-size = 16");
    ASSERT_EQ(settings.maxSize.get(), 16u);
}

TEST(Config, applyConfigSyntaxError)
{
    TestSettings settings;
    ASSERT_THROW(settings.applyConfig("max-problems 7\n"), UsageError);
    ASSERT_THROW(settings.applyConfig(" = 7\n"), UsageError);
}

TEST(Config, applyConfigInvalidValue)
{
    TestSettings settings;
    ASSERT_THROW(settings.applyConfig("max-problems = many\n"), UsageError);
}

} // namespace confcache
