#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "confcache/provider/value.hh"

namespace rc {
using namespace confcache;

/**
 * Values of every shape except `Handle`, nested a few levels deep.
 * Floats are exact quarters so that they compare equal after a round
 * trip.
 */
template<>
struct Arbitrary<Value>
{
    static Gen<Value> arbitrary();
};

template<>
struct Arbitrary<TypeRef>
{
    static Gen<TypeRef> arbitrary();
};

} // namespace rc
