#include "confcache/provider/value-source.hh"
#include "confcache/util/environment-variables.hh"
#include "confcache/util/file-system.hh"
#include "confcache/util/logging.hh"

namespace confcache {

std::optional<Value> ValueSourceProvider::getObtainedValueOrNull() const
{
    if (!obtainedValue)
        return std::nullopt;
    return *obtainedValue;
}

std::optional<Value> ValueSourceProvider::getOrNull() const
{
    if (!obtainedValue) {
        debug("obtaining value of %s", describe());
        obtainedValue.emplace(source->obtain(parameters));
    }
    return *obtainedValue;
}

ExecutionTimeValue ValueSourceProvider::calculateExecutionTimeValue() const
{
    if (obtainedValue) {
        if (!*obtainedValue)
            return ExecutionTimeValue::missing();
        return ExecutionTimeValue::fixedValue(**obtainedValue);
    }
    return ExecutionTimeValue::changingValue(self());
}

std::string ValueSourceProvider::describe() const
{
    return "valueSource(" + valueSourceType.name + ")";
}

DefaultValueSourceProviderFactory::DefaultValueSourceProviderFactory()
{
    registerValueSource(
        EnvironmentVariableValueSource::type,
        EnvironmentVariableValueSource::parametersType,
        make_ref<EnvironmentVariableValueSource>());
    registerValueSource(
        FileContentsValueSource::type, FileContentsValueSource::parametersType, make_ref<FileContentsValueSource>());
}

void DefaultValueSourceProviderFactory::registerValueSource(
    const TypeRef & valueSourceType, const TypeRef & parametersType, ref<const ValueSource> source)
{
    sources.insert_or_assign(valueSourceType.name, Registration{parametersType, std::move(source)});
}

ref<ValueSourceProvider> DefaultValueSourceProviderFactory::instantiateValueSourceProvider(
    const TypeRef & valueSourceType, const TypeRef & parametersType, const Value & parameters)
{
    auto i = sources.find(valueSourceType.name);
    if (i == sources.end())
        throw UnknownTypeError("value source type '%s' is not registered", valueSourceType.name);
    if (i->second.parametersType != parametersType)
        throw UnknownTypeError(
            "value source type '%s' takes parameters of type '%s', not '%s'",
            valueSourceType.name,
            i->second.parametersType.name,
            parametersType.name);
    return make_ref<ValueSourceProvider>(valueSourceType, parametersType, parameters, i->second.source);
}

ref<ValueSourceProvider>
DefaultValueSourceProviderFactory::createProvider(const TypeRef & valueSourceType, const Value & parameters)
{
    auto i = sources.find(valueSourceType.name);
    if (i == sources.end())
        throw UnknownTypeError("value source type '%s' is not registered", valueSourceType.name);
    return instantiateValueSourceProvider(valueSourceType, i->second.parametersType, parameters);
}

static const std::string & getStringParameter(const Value & parameters, const std::string & name)
{
    if (auto map = std::get_if<ValueMap>(&parameters.raw))
        if (auto v = map->get(Value(name)))
            if (auto s = std::get_if<std::string>(&v->raw))
                return *s;
    throw UsageError("value source parameters %s lack the string parameter '%s'", parameters.to_string(), name);
}

const TypeRef EnvironmentVariableValueSource::type{"EnvironmentVariableValueSource"};
const TypeRef EnvironmentVariableValueSource::parametersType{"EnvironmentVariableValueSource.Parameters"};

std::optional<Value> EnvironmentVariableValueSource::obtain(const Value & parameters) const
{
    auto v = getEnv(getStringParameter(parameters, "variableName"));
    if (!v)
        return std::nullopt;
    return Value(std::move(*v));
}

const TypeRef FileContentsValueSource::type{"FileContentsValueSource"};
const TypeRef FileContentsValueSource::parametersType{"FileContentsValueSource.Parameters"};

std::optional<Value> FileContentsValueSource::obtain(const Value & parameters) const
{
    std::filesystem::path path;
    if (auto map = std::get_if<ValueMap>(&parameters.raw))
        if (auto v = map->get(Value("file")))
            if (auto f = std::get_if<RegularFilePath>(&v->raw))
                path = f->path;
    if (path.empty())
        throw UsageError("value source parameters %s lack the regular file parameter 'file'", parameters.to_string());
    if (!pathExists(path))
        return std::nullopt;
    return Value(readFile(path));
}

} // namespace confcache
