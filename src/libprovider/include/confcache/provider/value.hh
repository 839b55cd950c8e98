#pragma once
///@file

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "confcache/util/error.hh"
#include "confcache/util/variant-wrapper.hh"

namespace confcache {

struct Value;

/**
 * The absent value. A fixed `Null` is read back as a missing value.
 */
struct Null
{
    bool operator==(const Null &) const = default;
};

struct DirectoryPath
{
    std::filesystem::path path;

    bool operator==(const DirectoryPath &) const = default;
};

struct RegularFilePath
{
    std::filesystem::path path;

    bool operator==(const RegularFilePath &) const = default;
};

/**
 * An object owned by the running build (e.g. a live build service).
 * Compared by identity. Handles can be passed around by providers but
 * never end up in a cache stream.
 */
struct Handle
{
    std::shared_ptr<void> object;
    std::string description;

    bool operator==(const Handle & other) const
    {
        return object == other.object;
    }
};

struct ValueList
{
    std::vector<Value> elems;

    bool operator==(const ValueList & other) const;
};

/**
 * A set that remembers insertion order.
 */
struct ValueSet
{
    std::vector<Value> elems;

    /**
     * @return false if an equal element was already present.
     */
    bool insert(Value v);

    bool contains(const Value & v) const;

    bool operator==(const ValueSet & other) const;
};

/**
 * A map that remembers insertion order. Equality ignores the order.
 */
struct ValueMap
{
    std::vector<std::pair<Value, Value>> entries;

    /**
     * Insert or replace the entry for `key`.
     */
    void put(Value key, Value value);

    const Value * get(const Value & key) const;

    bool operator==(const ValueMap & other) const;
};

/**
 * A configuration value as held by a provider.
 */
struct Value
{
    using Raw = std::variant<
        Null,
        bool,
        int64_t,
        double,
        std::string,
        DirectoryPath,
        RegularFilePath,
        ValueList,
        ValueSet,
        ValueMap,
        Handle>;

    Raw raw;

    MAKE_WRAPPER_CONSTRUCTOR(Value);

    Value(const char * s)
        : raw(std::string(s))
    {
    }

    bool isNull() const
    {
        return std::holds_alternative<Null>(raw);
    }

    /**
     * The name of the shape of this value, as used by `TypeRef`.
     */
    std::string_view shapeName() const;

    std::string to_string() const;

    bool operator==(const Value & other) const;
};

std::ostream & operator<<(std::ostream & str, const Value & v);

/**
 * A reference to a declared type, i.e. the class of the values a
 * provider holds. The builtin type names check the shape of a value;
 * any other name is an opaque reference that admits everything.
 */
struct TypeRef
{
    std::string name;

    static const TypeRef object;
    static const TypeRef boolean;
    static const TypeRef integer;
    static const TypeRef float_;
    static const TypeRef string;
    static const TypeRef directory;
    static const TypeRef regularFile;
    static const TypeRef list;
    static const TypeRef set;
    static const TypeRef map;

    bool admits(const Value & v) const;

    auto operator<=>(const TypeRef &) const = default;
};

std::ostream & operator<<(std::ostream & str, const TypeRef & t);

} // namespace confcache
