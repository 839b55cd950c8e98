#include <gtest/gtest.h>
#include <type_traits>

#include "confcache/util/ref.hh"

namespace confcache {

struct Base
{
    virtual ~Base() = default;
};

struct Derived : Base
{};

TEST(ref, upcast_is_implicit)
{
    static_assert(std::is_convertible_v<ref<Derived>, ref<Base>>);

    auto derived = make_ref<Derived>();
    ref<Base> base = derived;
    EXPECT_EQ(&*base, &*derived);
}

TEST(ref, const_conversion_shares_the_object)
{
    auto derived = make_ref<Derived>();
    ref<const Derived> constDerived = derived;
    EXPECT_EQ(&*constDerived, &*derived);
}

TEST(ref, null_is_rejected)
{
    EXPECT_THROW(ref<Base>(std::shared_ptr<Base>()), std::invalid_argument);
}

TEST(ref, explicit_downcast_with_cast)
{
    auto derived = make_ref<Derived>();
    ref<Base> base = derived;

    ref<Derived> backToDerived = base.cast<Derived>();
    EXPECT_EQ(&*backToDerived, &*derived);
}

TEST(ref, invalid_cast_throws)
{
    auto base = make_ref<Base>();
    EXPECT_THROW(base.cast<Derived>(), std::invalid_argument);
}

TEST(ref, explicit_downcast_with_dynamic_pointer_cast)
{
    auto base = make_ref<Base>();
    EXPECT_EQ(base.dynamic_pointer_cast<Derived>(), nullptr);

    auto derived = make_ref<Derived>();
    ref<Base> baseFromDerived = derived;
    EXPECT_NE(baseFromDerived.dynamic_pointer_cast<Derived>(), nullptr);
}

TEST(ref, equality_is_identity)
{
    auto a = make_ref<Derived>();
    auto b = make_ref<Derived>();
    ref<Derived> a2 = a;

    EXPECT_TRUE(a == a2);
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a != b);
}

} // namespace confcache
