#pragma once
/**
 * @file
 *
 * Shared services of a build, registered by name and limited in the
 * number of concurrent users.
 */

#include <map>

#include "confcache/provider/provider.hh"

namespace confcache {

MakeError(UsageLimitError, Error);

class BuildService
{
public:
    virtual ~BuildService() {}
};

typedef std::function<ref<BuildService>(const Value & parameters)> BuildServiceFactory;

/**
 * Provides a build service, creating it the first time its value is
 * queried. Its value is always changing: a cache only records how to
 * register the service again.
 */
class BuildServiceProvider : public Provider
{
    std::string name;
    TypeRef implementationType;
    Value parameters;
    BuildServiceFactory factory;

    mutable std::shared_ptr<BuildService> instance;

public:

    BuildServiceProvider(std::string name, TypeRef implementationType, Value parameters, BuildServiceFactory factory)
        : name(std::move(name))
        , implementationType(std::move(implementationType))
        , parameters(std::move(parameters))
        , factory(std::move(factory))
    {
    }

    const std::string & getName() const
    {
        return name;
    }

    const TypeRef & getImplementationType() const
    {
        return implementationType;
    }

    const Value & getParameters() const
    {
        return parameters;
    }

    ref<BuildService> getService() const;

    /**
     * A `Handle` to the service.
     */
    std::optional<Value> getOrNull() const override;

    ExecutionTimeValue calculateExecutionTimeValue() const override
    {
        return ExecutionTimeValue::changingValue(self());
    }

    std::string describe() const override;
};

class BuildServiceRegistry
{
public:

    virtual ~BuildServiceRegistry() {}

    /**
     * Register a service, or return the provider of the service
     * already registered under `name`.
     *
     * @param maxUsages The number of concurrent users allowed, or -1
     * for no limit.
     */
    virtual ref<BuildServiceProvider> registerService(
        const std::string & name, const TypeRef & implementationType, const Value & parameters, int maxUsages) = 0;

    /**
     * @return the usage limit the service was registered with.
     */
    virtual int usageLimitOf(const BuildServiceProvider & provider) = 0;
};

class DefaultBuildServiceRegistry;

/**
 * A use of a build service. Counts against the usage limit of the
 * service until destroyed.
 */
class BuildServiceLease
{
    DefaultBuildServiceRegistry * registry;
    std::string name;
    ref<BuildService> service;

    friend class DefaultBuildServiceRegistry;

    BuildServiceLease(DefaultBuildServiceRegistry & registry, std::string name, ref<BuildService> service)
        : registry(&registry)
        , name(std::move(name))
        , service(std::move(service))
    {
    }

public:

    BuildServiceLease(BuildServiceLease && other);

    BuildServiceLease(const BuildServiceLease &) = delete;
    BuildServiceLease & operator=(const BuildServiceLease &) = delete;

    ~BuildServiceLease();

    BuildService & operator*() const
    {
        return *service;
    }

    BuildService * operator->() const
    {
        return &*service;
    }
};

class DefaultBuildServiceRegistry : public BuildServiceRegistry
{
public:

    struct Registration
    {
        ref<BuildServiceProvider> provider;
        int maxUsages;
        int activeLeases = 0;
    };

private:

    std::map<std::string, BuildServiceFactory> implementations;
    std::map<std::string, Registration> services;

    friend class BuildServiceLease;

public:

    void registerImplementation(const TypeRef & implementationType, BuildServiceFactory factory);

    /**
     * Throws `UnknownTypeError` if no implementation is registered for
     * `implementationType`, and `UsageError` if `name` is taken by a
     * service of another type.
     */
    ref<BuildServiceProvider> registerService(
        const std::string & name, const TypeRef & implementationType, const Value & parameters, int maxUsages)
        override;

    int usageLimitOf(const BuildServiceProvider & provider) override;

    /**
     * Throws `Error` if `provider` is not registered with this registry.
     */
    Registration & forService(const BuildServiceProvider & provider);

    std::shared_ptr<BuildServiceProvider> lookup(const std::string & name) const;

    /**
     * Acquire a use of the service. Throws `UsageLimitError` if all
     * allowed uses are taken.
     */
    BuildServiceLease acquire(const BuildServiceProvider & provider);
};

} // namespace confcache
