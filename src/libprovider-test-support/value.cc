#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck.h>

#include <algorithm>

#include "confcache/provider/tests/value.hh"

namespace rc {
using namespace confcache;

static Gen<Value> genScalar()
{
    return gen::oneOf(
        gen::just(Value(Null{})),
        gen::map(gen::arbitrary<bool>(), [](bool b) { return Value(b); }),
        gen::map(gen::arbitrary<int64_t>(), [](int64_t n) { return Value(n); }),
        gen::map(gen::arbitrary<int32_t>(), [](int32_t n) { return Value(n / 4.0); }),
        gen::map(gen::arbitrary<std::string>(), [](std::string s) { return Value(std::move(s)); }),
        gen::map(gen::arbitrary<std::string>(), [](std::string s) { return Value(DirectoryPath{"/build/" + s}); }),
        gen::map(gen::arbitrary<std::string>(), [](std::string s) { return Value(RegularFilePath{"/build/" + s}); }));
}

static Gen<Value> genValue(int depth)
{
    if (depth <= 0)
        return genScalar();

    auto elem = gen::lazy(&genValue, depth - 1);
    auto elems = gen::resize(4, gen::container<std::vector<Value>>(elem));
    auto entries = gen::resize(4, gen::container<std::vector<std::pair<Value, Value>>>(gen::pair(elem, elem)));

    return gen::oneOf(
        genScalar(),
        gen::map(elems, [](std::vector<Value> elems) { return Value(ValueList{std::move(elems)}); }),
        gen::map(
            elems,
            [](std::vector<Value> elems) {
                ValueSet set;
                for (auto & e : elems)
                    set.insert(std::move(e));
                return Value(std::move(set));
            }),
        gen::map(entries, [](std::vector<std::pair<Value, Value>> entries) {
            ValueMap map;
            for (auto & [k, v] : entries)
                map.put(std::move(k), std::move(v));
            return Value(std::move(map));
        }));
}

Gen<Value> Arbitrary<Value>::arbitrary()
{
    return gen::withSize([](int size) { return genValue(std::min(size / 30, 3)); });
}

Gen<TypeRef> Arbitrary<TypeRef>::arbitrary()
{
    return gen::oneOf(
        gen::elementOf(std::vector<TypeRef>{
            TypeRef::object,
            TypeRef::boolean,
            TypeRef::integer,
            TypeRef::string,
            TypeRef::directory,
            TypeRef::regularFile}),
        gen::map(gen::nonEmpty(gen::string<std::string>()), [](std::string name) { return TypeRef{"org.example." + name}; }));
}

} // namespace rc
