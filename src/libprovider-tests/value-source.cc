#include <gtest/gtest.h>

#include <unistd.h>

#include "confcache/provider/value-source.hh"
#include "confcache/provider/tests/test-providers.hh"
#include "confcache/util/environment-variables.hh"
#include "confcache/util/file-system.hh"

namespace confcache {

class ValueSourceTest : public ::testing::Test
{
protected:
    TestValueSourceProviderFactory factory;
};

TEST_F(ValueSourceTest, changingUntilObtained)
{
    auto p = factory.createProvider(EchoValueSource::type, "input");

    ASSERT_FALSE(p->hasBeenObtained());
    ASSERT_FALSE(p->getObtainedValueOrNull().has_value());

    auto state = p->calculateExecutionTimeValue();
    ASSERT_TRUE(state.isChangingValue());
    ASSERT_EQ(&*state.getChangingValue(), &*p);
    ASSERT_EQ(factory.echo->obtained, 0u);
}

TEST_F(ValueSourceTest, obtainedOnce)
{
    auto p = factory.createProvider(EchoValueSource::type, "input");

    ASSERT_EQ(p->get(), Value("input"));
    ASSERT_EQ(p->get(), Value("input"));
    ASSERT_EQ(factory.echo->obtained, 1u);

    ASSERT_TRUE(p->hasBeenObtained());
    ASSERT_EQ(p->getObtainedValueOrNull(), Value("input"));

    auto state = p->calculateExecutionTimeValue();
    ASSERT_TRUE(state.isFixedValue());
    ASSERT_EQ(state.getFixedValue(), Value("input"));
}

TEST_F(ValueSourceTest, obtainedWithoutValueIsMissing)
{
    auto p = factory.createProvider(EchoValueSource::type, Null{});

    ASSERT_FALSE(p->isPresent());
    ASSERT_TRUE(p->hasBeenObtained());
    ASSERT_FALSE(p->getObtainedValueOrNull().has_value());
    ASSERT_TRUE(p->calculateExecutionTimeValue().isMissing());
}

TEST_F(ValueSourceTest, accessors)
{
    auto p = factory.createProvider(EchoValueSource::type, "input");

    ASSERT_EQ(p->getValueSourceType(), EchoValueSource::type);
    ASSERT_EQ(p->getParametersType(), EchoValueSource::parametersType);
    ASSERT_EQ(p->getParameters(), Value("input"));
    ASSERT_EQ(factory.instantiated, 1u);
}

TEST_F(ValueSourceTest, unknownSourceType)
{
    ASSERT_THROW(factory.createProvider(TypeRef{"org.example.Unknown"}, Null{}), UnknownTypeError);
    ASSERT_THROW(
        factory.instantiateValueSourceProvider(TypeRef{"org.example.Unknown"}, TypeRef{"org.example.Unknown.Parameters"}, Null{}),
        UnknownTypeError);
}

TEST_F(ValueSourceTest, parametersTypeMustMatch)
{
    ASSERT_THROW(
        factory.instantiateValueSourceProvider(EchoValueSource::type, TypeRef::string, "input"), UnknownTypeError);
}

/* ----------------------------------------------------------------------------
 * builtin sources
 * --------------------------------------------------------------------------*/

static Value parameters(const std::string & name, Value value)
{
    ValueMap map;
    map.put(name, std::move(value));
    return map;
}

TEST_F(ValueSourceTest, environmentVariable)
{
    std::string name = "CONFCACHE_PROVIDER_TESTS_" + std::to_string(getpid());
    setEnv(name, "from the environment");

    auto p = factory.createProvider(EnvironmentVariableValueSource::type, parameters("variableName", name));
    ASSERT_EQ(p->get(), Value("from the environment"));

    unsetEnv(name);
    ASSERT_EQ(p->get(), Value("from the environment"));

    auto unset = factory.createProvider(EnvironmentVariableValueSource::type, parameters("variableName", name));
    ASSERT_FALSE(unset->isPresent());
}

TEST_F(ValueSourceTest, environmentVariableNeedsName)
{
    auto p = factory.createProvider(EnvironmentVariableValueSource::type, parameters("name", "HOME"));
    ASSERT_THROW(p->get(), UsageError);
}

TEST_F(ValueSourceTest, fileContents)
{
    auto path = std::filesystem::temp_directory_path()
                / ("confcache-provider-tests-" + std::to_string(getpid()));
    writeFile(path, "build.caching=true\n");

    auto p = factory.createProvider(FileContentsValueSource::type, parameters("file", RegularFilePath{path}));
    ASSERT_EQ(p->get(), Value("build.caching=true\n"));

    std::filesystem::remove(path);

    auto missing = factory.createProvider(FileContentsValueSource::type, parameters("file", RegularFilePath{path}));
    ASSERT_FALSE(missing->isPresent());
}

} // namespace confcache
