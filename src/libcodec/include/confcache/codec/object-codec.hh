#pragma once
/**
 * @file
 *
 * The generic codec for values and for the provider shapes that no
 * dedicated codec handles.
 */

#include <map>

#include "confcache/codec/context.hh"

namespace confcache {

/**
 * The contract of a generic object codec. Values are nullable: a `Null`
 * value is written and read back like any other.
 */
class ObjectCodec
{
public:

    virtual ~ObjectCodec() {}

    virtual void writeValue(WriteContext & ctx, const Value & v) const = 0;

    virtual Value readValue(ReadContext & ctx) const = 0;

    /**
     * Whether `writeProvider()` can write `provider`.
     */
    virtual bool acceptsProvider(const Provider & provider) const = 0;

    virtual void writeProvider(WriteContext & ctx, ref<const Provider> provider) const = 0;

    virtual ref<const Provider> readProvider(ReadContext & ctx) const = 0;
};

/**
 * Writes values with a one-byte shape tag followed by the shape's
 * payload, and `SerialisableProvider`s as their type and state. Only
 * providers whose type has a registered reader are accepted.
 */
class DefaultObjectCodec : public ObjectCodec
{
public:

    enum struct Tag : uint8_t {
        Null = 0,
        False = 1,
        True = 2,
        Integer = 3,
        Float = 4,
        String = 5,
        Directory = 6,
        RegularFile = 7,
        List = 8,
        Set = 9,
        Map = 10,
    };

    typedef std::function<ref<const Provider>(const Value & state)> ProviderReader;

private:

    std::map<std::string, ProviderReader> readers;

public:

    void registerReader(const TypeRef & type, ProviderReader reader);

    void writeValue(WriteContext & ctx, const Value & v) const override;

    Value readValue(ReadContext & ctx) const override;

    bool acceptsProvider(const Provider & provider) const override;

    void writeProvider(WriteContext & ctx, ref<const Provider> provider) const override;

    ref<const Provider> readProvider(ReadContext & ctx) const override;
};

} // namespace confcache
