#include <gtest/gtest.h>

#include "confcache/provider/build-service.hh"
#include "confcache/provider/tests/test-providers.hh"

namespace confcache {

class BuildServiceTest : public ::testing::Test
{
protected:
    TestBuildServiceRegistry registry;
};

TEST_F(BuildServiceTest, serviceIsCreatedLazily)
{
    auto p = registry.registerService("cache", TestBuildService::type, "params", -1);
    ASSERT_EQ(registry.servicesCreated, 0u);

    auto handle = p->get();
    ASSERT_EQ(registry.servicesCreated, 1u);
    ASSERT_EQ(p->get(), handle);
    ASSERT_EQ(registry.servicesCreated, 1u);

    auto & service = dynamic_cast<TestBuildService &>(*p->getService());
    ASSERT_EQ(service.parameters, Value("params"));
}

TEST_F(BuildServiceTest, valueIsAlwaysChanging)
{
    auto p = registry.registerService("cache", TestBuildService::type, Null{}, -1);
    p->get();

    auto state = p->calculateExecutionTimeValue();
    ASSERT_TRUE(state.isChangingValue());
    ASSERT_EQ(&*state.getChangingValue(), &*p);
}

TEST_F(BuildServiceTest, registeringTwiceReturnsTheSameProvider)
{
    auto a = registry.registerService("cache", TestBuildService::type, "params", 2);
    auto b = registry.registerService("cache", TestBuildService::type, "other params", 5);

    ASSERT_EQ(&*a, &*b);
    ASSERT_EQ(registry.usageLimitOf(*b), 2);
    ASSERT_EQ(b->getParameters(), Value("params"));
    ASSERT_EQ(&*registry.lookup("cache"), &*a);
    ASSERT_EQ(registry.lookup("other"), nullptr);
}

TEST_F(BuildServiceTest, nameTakenByAnotherType)
{
    TypeRef other{"org.example.OtherService"};
    registry.registerImplementation(other, [](const Value & parameters) -> ref<BuildService> {
        return make_ref<TestBuildService>(parameters);
    });

    registry.registerService("cache", TestBuildService::type, Null{}, -1);
    ASSERT_THROW(registry.registerService("cache", other, Null{}, -1), UsageError);
}

TEST_F(BuildServiceTest, unknownImplementation)
{
    ASSERT_THROW(registry.registerService("cache", TypeRef{"org.example.Unknown"}, Null{}, -1), UnknownTypeError);
}

TEST_F(BuildServiceTest, invalidUsageLimit)
{
    ASSERT_THROW(registry.registerService("cache", TestBuildService::type, Null{}, -2), UsageError);
}

TEST_F(BuildServiceTest, foreignProvider)
{
    TestBuildServiceRegistry other;
    auto p = other.registerService("cache", TestBuildService::type, Null{}, -1);

    ASSERT_THROW(registry.usageLimitOf(*p), Error);

    registry.registerService("cache", TestBuildService::type, Null{}, -1);
    ASSERT_THROW(registry.usageLimitOf(*p), Error);
}

TEST_F(BuildServiceTest, usageLimit)
{
    auto p = registry.registerService("cache", TestBuildService::type, Null{}, 1);

    {
        auto lease = registry.acquire(*p);
        ASSERT_EQ(registry.forService(*p).activeLeases, 1);
        ASSERT_THROW(registry.acquire(*p), UsageLimitError);
    }

    ASSERT_EQ(registry.forService(*p).activeLeases, 0);
    auto lease = registry.acquire(*p);
    ASSERT_NE(dynamic_cast<TestBuildService *>(&*lease), nullptr);
}

TEST_F(BuildServiceTest, unlimitedUsages)
{
    auto p = registry.registerService("cache", TestBuildService::type, Null{}, -1);

    std::vector<BuildServiceLease> leases;
    for (int i = 0; i < 10; ++i)
        leases.push_back(registry.acquire(*p));
    ASSERT_EQ(registry.forService(*p).activeLeases, 10);

    leases.clear();
    ASSERT_EQ(registry.forService(*p).activeLeases, 0);
}

TEST_F(BuildServiceTest, movedLeaseIsReleasedOnce)
{
    auto p = registry.registerService("cache", TestBuildService::type, Null{}, 1);

    {
        auto lease = registry.acquire(*p);
        auto moved = std::move(lease);
        ASSERT_EQ(registry.forService(*p).activeLeases, 1);
    }

    ASSERT_EQ(registry.forService(*p).activeLeases, 0);
}

} // namespace confcache
