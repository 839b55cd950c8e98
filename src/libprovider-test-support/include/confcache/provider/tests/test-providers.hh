#pragma once
///@file

#include "confcache/provider/build-service.hh"
#include "confcache/provider/value-source.hh"

namespace confcache {

/**
 * A changing provider that the generic object codec can write: its
 * value is a greeting for the name it holds.
 */
class GreetingProvider : public SerialisableProvider
{
    std::string name;

public:

    static const TypeRef greetingType;

    GreetingProvider(std::string name)
        : name(std::move(name))
    {
    }

    TypeRef type() const override
    {
        return greetingType;
    }

    Value state() const override
    {
        return name;
    }

    std::optional<Value> getOrNull() const override
    {
        return Value("hello, " + name);
    }

    std::string describe() const override
    {
        return "greeting(" + name + ")";
    }
};

/**
 * A changing provider that no codec knows about.
 */
class OpaqueChangingProvider : public Provider
{
public:

    std::optional<Value> getOrNull() const override
    {
        return Value("opaque");
    }

    ExecutionTimeValue calculateExecutionTimeValue() const override
    {
        return ExecutionTimeValue::changingValue(self());
    }

    std::string describe() const override
    {
        return "opaque";
    }
};

/**
 * A value source that yields its parameters, or nothing for `Null`
 * parameters. Counts how often it is obtained.
 */
struct EchoValueSource : ValueSource
{
    static const TypeRef type;
    static const TypeRef parametersType;

    mutable size_t obtained = 0;

    std::optional<Value> obtain(const Value & parameters) const override
    {
        obtained++;
        if (parameters.isNull())
            return std::nullopt;
        return parameters;
    }
};

/**
 * A value source factory with the echo source registered, counting the
 * providers it instantiates.
 */
class TestValueSourceProviderFactory : public DefaultValueSourceProviderFactory
{
public:

    ref<EchoValueSource> echo = make_ref<EchoValueSource>();
    size_t instantiated = 0;

    TestValueSourceProviderFactory()
    {
        registerValueSource(EchoValueSource::type, EchoValueSource::parametersType, echo);
    }

    ref<ValueSourceProvider> instantiateValueSourceProvider(
        const TypeRef & valueSourceType, const TypeRef & parametersType, const Value & parameters) override
    {
        instantiated++;
        return DefaultValueSourceProviderFactory::instantiateValueSourceProvider(
            valueSourceType, parametersType, parameters);
    }
};

struct TestBuildService : BuildService
{
    static const TypeRef type;

    Value parameters;

    TestBuildService(Value parameters)
        : parameters(std::move(parameters))
    {
    }
};

/**
 * A build service registry with `TestBuildService` registered, counting
 * the calls to `registerService()`.
 */
class TestBuildServiceRegistry : public DefaultBuildServiceRegistry
{
public:

    size_t registrations = 0;
    size_t servicesCreated = 0;

    TestBuildServiceRegistry()
    {
        registerImplementation(TestBuildService::type, [this](const Value & parameters) -> ref<BuildService> {
            servicesCreated++;
            return make_ref<TestBuildService>(parameters);
        });
    }

    ref<BuildServiceProvider> registerService(
        const std::string & name, const TypeRef & implementationType, const Value & parameters, int maxUsages)
        override
    {
        registrations++;
        return DefaultBuildServiceRegistry::registerService(name, implementationType, parameters, maxUsages);
    }
};

} // namespace confcache
