#include "confcache/provider/build-service.hh"
#include "confcache/util/logging.hh"

namespace confcache {

ref<BuildService> BuildServiceProvider::getService() const
{
    if (!instance) {
        debug("creating build service '%s' of type '%s'", name, implementationType.name);
        instance = factory(parameters).get_ptr();
    }
    return ref<BuildService>(instance);
}

std::optional<Value> BuildServiceProvider::getOrNull() const
{
    return Value(Handle{getService().get_ptr(), describe()});
}

std::string BuildServiceProvider::describe() const
{
    return "service '" + name + "'";
}

BuildServiceLease::BuildServiceLease(BuildServiceLease && other)
    : registry(other.registry)
    , name(std::move(other.name))
    , service(other.service)
{
    other.registry = nullptr;
}

BuildServiceLease::~BuildServiceLease()
{
    if (!registry)
        return;
    auto i = registry->services.find(name);
    if (i != registry->services.end())
        i->second.activeLeases--;
}

void DefaultBuildServiceRegistry::registerImplementation(const TypeRef & implementationType, BuildServiceFactory factory)
{
    implementations.insert_or_assign(implementationType.name, std::move(factory));
}

ref<BuildServiceProvider> DefaultBuildServiceRegistry::registerService(
    const std::string & name, const TypeRef & implementationType, const Value & parameters, int maxUsages)
{
    if (auto i = services.find(name); i != services.end()) {
        if (i->second.provider->getImplementationType() != implementationType)
            throw UsageError(
                "build service '%s' is already registered with type '%s'",
                name,
                i->second.provider->getImplementationType().name);
        return i->second.provider;
    }

    auto impl = implementations.find(implementationType.name);
    if (impl == implementations.end())
        throw UnknownTypeError("build service type '%s' is not registered", implementationType.name);

    if (maxUsages < -1)
        throw UsageError("build service '%s' has an invalid usage limit %d", name, maxUsages);

    debug("registering build service '%s' with usage limit %d", name, maxUsages);

    auto provider = make_ref<BuildServiceProvider>(name, implementationType, parameters, impl->second);
    services.emplace(name, Registration{provider, maxUsages});
    return provider;
}

int DefaultBuildServiceRegistry::usageLimitOf(const BuildServiceProvider & provider)
{
    return forService(provider).maxUsages;
}

DefaultBuildServiceRegistry::Registration & DefaultBuildServiceRegistry::forService(const BuildServiceProvider & provider)
{
    auto i = services.find(provider.getName());
    if (i == services.end() || &*i->second.provider != &provider)
        throw Error("build service '%s' is not registered with this registry", provider.getName());
    return i->second;
}

std::shared_ptr<BuildServiceProvider> DefaultBuildServiceRegistry::lookup(const std::string & name) const
{
    auto i = services.find(name);
    if (i == services.end())
        return nullptr;
    return i->second.provider.get_ptr();
}

BuildServiceLease DefaultBuildServiceRegistry::acquire(const BuildServiceProvider & provider)
{
    auto & reg = forService(provider);
    if (reg.maxUsages != -1 && reg.activeLeases >= reg.maxUsages)
        throw UsageLimitError(
            "build service '%s' is already used by %d of at most %d users",
            provider.getName(),
            reg.activeLeases,
            reg.maxUsages);
    reg.activeLeases++;
    return BuildServiceLease(*this, provider.getName(), provider.getService());
}

} // namespace confcache
