#pragma once
/**
 * @file
 *
 * External inputs of the build (environment variables, files, ...) that
 * are only read when their value is needed.
 */

#include <map>

#include "confcache/provider/provider.hh"

namespace confcache {

/**
 * An external input. `obtain()` is called at most once per provider.
 */
class ValueSource
{
public:

    virtual ~ValueSource() {}

    /**
     * @return the value of the input, or `std::nullopt` if it has none.
     */
    virtual std::optional<Value> obtain(const Value & parameters) const = 0;
};

/**
 * A provider backed by a value source. It stays changing until someone
 * obtains its value. After that the obtained value is fixed.
 */
class ValueSourceProvider : public Provider
{
    TypeRef valueSourceType;
    TypeRef parametersType;
    Value parameters;
    ref<const ValueSource> source;

    mutable std::optional<std::optional<Value>> obtainedValue;

public:

    ValueSourceProvider(TypeRef valueSourceType, TypeRef parametersType, Value parameters, ref<const ValueSource> source)
        : valueSourceType(std::move(valueSourceType))
        , parametersType(std::move(parametersType))
        , parameters(std::move(parameters))
        , source(std::move(source))
    {
    }

    const TypeRef & getValueSourceType() const
    {
        return valueSourceType;
    }

    const TypeRef & getParametersType() const
    {
        return parametersType;
    }

    const Value & getParameters() const
    {
        return parameters;
    }

    bool hasBeenObtained() const
    {
        return obtainedValue.has_value();
    }

    /**
     * The value obtained so far, if the source has been used as a build
     * logic input. `std::nullopt` if it has not been obtained yet, or if
     * it was obtained and had no value.
     */
    std::optional<Value> getObtainedValueOrNull() const;

    std::optional<Value> getOrNull() const override;

    ExecutionTimeValue calculateExecutionTimeValue() const override;

    std::string describe() const override;
};

/**
 * Instantiates providers for the value sources registered with it.
 */
class ValueSourceProviderFactory
{
public:

    virtual ~ValueSourceProviderFactory() {}

    virtual ref<ValueSourceProvider>
    instantiateValueSourceProvider(const TypeRef & valueSourceType, const TypeRef & parametersType, const Value & parameters) = 0;
};

class DefaultValueSourceProviderFactory : public ValueSourceProviderFactory
{
    struct Registration
    {
        TypeRef parametersType;
        ref<const ValueSource> source;
    };

    std::map<std::string, Registration> sources;

public:

    /**
     * Register the builtin sources.
     */
    DefaultValueSourceProviderFactory();

    void registerValueSource(const TypeRef & valueSourceType, const TypeRef & parametersType, ref<const ValueSource> source);

    /**
     * Throws `UnknownTypeError` if the source type is not registered or
     * takes parameters of another type.
     */
    ref<ValueSourceProvider> instantiateValueSourceProvider(
        const TypeRef & valueSourceType, const TypeRef & parametersType, const Value & parameters) override;

    /**
     * Like `instantiateValueSourceProvider()`, with the registered
     * parameters type.
     */
    ref<ValueSourceProvider> createProvider(const TypeRef & valueSourceType, const Value & parameters);
};

/**
 * Reads the environment variable named by the `variableName` parameter.
 */
struct EnvironmentVariableValueSource : ValueSource
{
    static const TypeRef type;
    static const TypeRef parametersType;

    std::optional<Value> obtain(const Value & parameters) const override;
};

/**
 * Reads the contents of the regular file in the `file` parameter. A file
 * that does not exist has no value.
 */
struct FileContentsValueSource : ValueSource
{
    static const TypeRef type;
    static const TypeRef parametersType;

    std::optional<Value> obtain(const Value & parameters) const override;
};

} // namespace confcache
