#pragma once
///@file

#include "confcache/codec/property-codecs.hh"

namespace confcache {

/**
 * All codecs of the configuration cache, wired to the collaborators that
 * rebuild value sources, build services and properties.
 */
class Codecs
{
    FixedValueReplacingProviderCodec providerCodec;
    PropertyCodec propertyCodec;
    ListPropertyCodec listPropertyCodec;
    SetPropertyCodec setPropertyCodec;
    MapPropertyCodec mapPropertyCodec;
    DirectoryPropertyCodec directoryPropertyCodec;
    RegularFilePropertyCodec regularFilePropertyCodec;

public:

    /**
     * The kind of property written by `writeProperty()`.
     */
    enum struct PropertyKind : uint8_t {
        Scalar = 0,
        List = 1,
        Set = 2,
        Map = 3,
        Directory = 4,
        RegularFile = 5,
    };

    Codecs(
        ValueSourceProviderFactory & valueSourceProviderFactory,
        BuildServiceRegistry & buildServiceRegistry,
        const PropertyFactory & propertyFactory,
        const FilePropertyFactory & filePropertyFactory);

    Codecs(const Codecs &) = delete;

    const FixedValueReplacingProviderCodec & providers() const
    {
        return providerCodec;
    }

    void writeProvider(WriteContext & ctx, const Provider & provider) const;

    ref<const Provider> readProvider(ReadContext & ctx) const;

    /**
     * Write a property of any kind, preceded by its kind.
     */
    void writeProperty(WriteContext & ctx, const Property & property) const;

    ref<Property> readProperty(ReadContext & ctx) const;
};

} // namespace confcache
