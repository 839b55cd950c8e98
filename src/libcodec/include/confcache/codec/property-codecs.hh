#pragma once
/**
 * @file
 *
 * Codecs for the typed properties. Each writes the declared type(s) of
 * the property and then its value through the
 * `FixedValueReplacingProviderCodec`.
 */

#include "confcache/codec/provider-codecs.hh"
#include "confcache/provider/property.hh"

namespace confcache {

template<typename T>
class Codec
{
public:

    virtual ~Codec() {}

    virtual void encode(WriteContext & ctx, const T & value) const = 0;

    virtual ref<T> decode(ReadContext & ctx) const = 0;
};

/**
 * Base of the property codecs holding their collaborators.
 */
template<typename T, typename Factory>
class PropertyCodecBase : public Codec<T>
{
protected:

    const Factory & factory;
    const FixedValueReplacingProviderCodec & providerCodec;

public:

    PropertyCodecBase(const Factory & factory, const FixedValueReplacingProviderCodec & providerCodec)
        : factory(factory)
        , providerCodec(providerCodec)
    {
    }
};

/**
 * Writes the type and then the backing provider of the property, via
 * `encodeProvider()`.
 */
class PropertyCodec : public PropertyCodecBase<ScalarProperty, PropertyFactory>
{
public:
    using PropertyCodecBase::PropertyCodecBase;

    void encode(WriteContext & ctx, const ScalarProperty & value) const override;

    ref<ScalarProperty> decode(ReadContext & ctx) const override;
};

/**
 * Writes the element type and then the execution-time value of the
 * property, via `encodeValue()`.
 */
class ListPropertyCodec : public PropertyCodecBase<ListProperty, PropertyFactory>
{
public:
    using PropertyCodecBase::PropertyCodecBase;

    void encode(WriteContext & ctx, const ListProperty & value) const override;

    ref<ListProperty> decode(ReadContext & ctx) const override;
};

class SetPropertyCodec : public PropertyCodecBase<SetProperty, PropertyFactory>
{
public:
    using PropertyCodecBase::PropertyCodecBase;

    void encode(WriteContext & ctx, const SetProperty & value) const override;

    ref<SetProperty> decode(ReadContext & ctx) const override;
};

/**
 * Writes the key type, the value type and then the execution-time value
 * of the property.
 */
class MapPropertyCodec : public PropertyCodecBase<MapProperty, PropertyFactory>
{
public:
    using PropertyCodecBase::PropertyCodecBase;

    void encode(WriteContext & ctx, const MapProperty & value) const override;

    ref<MapProperty> decode(ReadContext & ctx) const override;
};

class DirectoryPropertyCodec : public PropertyCodecBase<DirectoryProperty, FilePropertyFactory>
{
public:
    using PropertyCodecBase::PropertyCodecBase;

    void encode(WriteContext & ctx, const DirectoryProperty & value) const override;

    ref<DirectoryProperty> decode(ReadContext & ctx) const override;
};

class RegularFilePropertyCodec : public PropertyCodecBase<RegularFileProperty, FilePropertyFactory>
{
public:
    using PropertyCodecBase::PropertyCodecBase;

    void encode(WriteContext & ctx, const RegularFileProperty & value) const override;

    ref<RegularFileProperty> decode(ReadContext & ctx) const override;
};

} // namespace confcache
