#include "confcache/provider/value.hh"
#include "confcache/util/strings.hh"

#include <algorithm>
#include <sstream>

namespace confcache {

bool ValueList::operator==(const ValueList & other) const
{
    return elems == other.elems;
}

bool ValueSet::insert(Value v)
{
    if (contains(v))
        return false;
    elems.push_back(std::move(v));
    return true;
}

bool ValueSet::contains(const Value & v) const
{
    return std::find(elems.begin(), elems.end(), v) != elems.end();
}

bool ValueSet::operator==(const ValueSet & other) const
{
    if (elems.size() != other.elems.size())
        return false;
    for (auto & e : elems)
        if (!other.contains(e))
            return false;
    return true;
}

void ValueMap::put(Value key, Value value)
{
    for (auto & [k, v] : entries)
        if (k == key) {
            v = std::move(value);
            return;
        }
    entries.emplace_back(std::move(key), std::move(value));
}

const Value * ValueMap::get(const Value & key) const
{
    for (auto & [k, v] : entries)
        if (k == key)
            return &v;
    return nullptr;
}

bool ValueMap::operator==(const ValueMap & other) const
{
    if (entries.size() != other.entries.size())
        return false;
    for (auto & [k, v] : entries) {
        auto v2 = other.get(k);
        if (!v2 || !(*v2 == v))
            return false;
    }
    return true;
}

bool Value::operator==(const Value & other) const
{
    return raw == other.raw;
}

std::string_view Value::shapeName() const
{
    return std::visit(
        overloaded{
            [](const Null &) { return "Null"; },
            [](const bool &) { return "Boolean"; },
            [](const int64_t &) { return "Integer"; },
            [](const double &) { return "Float"; },
            [](const std::string &) { return "String"; },
            [](const DirectoryPath &) { return "Directory"; },
            [](const RegularFilePath &) { return "RegularFile"; },
            [](const ValueList &) { return "List"; },
            [](const ValueSet &) { return "Set"; },
            [](const ValueMap &) { return "Map"; },
            [](const Handle &) { return "Handle"; },
        },
        raw);
}

std::string Value::to_string() const
{
    std::ostringstream str;
    str << *this;
    return str.str();
}

std::ostream & operator<<(std::ostream & str, const Value & v)
{
    auto printElems = [&](const std::vector<Value> & elems) {
        bool first = true;
        for (auto & e : elems) {
            if (!first)
                str << ", ";
            str << e;
            first = false;
        }
    };

    std::visit(
        overloaded{
            [&](const Null &) { str << "null"; },
            [&](const bool & b) { str << (b ? "true" : "false"); },
            [&](const int64_t & n) { str << n; },
            [&](const double & d) { str << d; },
            [&](const std::string & s) { str << '"' << s << '"'; },
            [&](const DirectoryPath & d) { str << "directory '" << d.path.string() << "'"; },
            [&](const RegularFilePath & f) { str << "file '" << f.path.string() << "'"; },
            [&](const ValueList & l) {
                str << '[';
                printElems(l.elems);
                str << ']';
            },
            [&](const ValueSet & s) {
                str << '{';
                printElems(s.elems);
                str << '}';
            },
            [&](const ValueMap & m) {
                str << '{';
                bool first = true;
                for (auto & [k, v] : m.entries) {
                    if (!first)
                        str << ", ";
                    str << k << ": " << v;
                    first = false;
                }
                str << '}';
            },
            [&](const Handle & h) { str << "<" << h.description << ">"; },
        },
        v.raw);
    return str;
}

const TypeRef TypeRef::object{"Object"};
const TypeRef TypeRef::boolean{"Boolean"};
const TypeRef TypeRef::integer{"Integer"};
const TypeRef TypeRef::float_{"Float"};
const TypeRef TypeRef::string{"String"};
const TypeRef TypeRef::directory{"Directory"};
const TypeRef TypeRef::regularFile{"RegularFile"};
const TypeRef TypeRef::list{"List"};
const TypeRef TypeRef::set{"Set"};
const TypeRef TypeRef::map{"Map"};

bool TypeRef::admits(const Value & v) const
{
    static const StringSet builtins{
        "Boolean", "Integer", "Float", "String", "Directory", "RegularFile", "List", "Set", "Map"};
    if (!builtins.contains(name))
        return true;
    return v.shapeName() == name;
}

std::ostream & operator<<(std::ostream & str, const TypeRef & t)
{
    return str << t.name;
}

} // namespace confcache
