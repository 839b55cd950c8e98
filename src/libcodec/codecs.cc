#include "confcache/codec/codecs.hh"

namespace confcache {

Codecs::Codecs(
    ValueSourceProviderFactory & valueSourceProviderFactory,
    BuildServiceRegistry & buildServiceRegistry,
    const PropertyFactory & propertyFactory,
    const FilePropertyFactory & filePropertyFactory)
    : providerCodec(valueSourceProviderFactory, buildServiceRegistry)
    , propertyCodec(propertyFactory, providerCodec)
    , listPropertyCodec(propertyFactory, providerCodec)
    , setPropertyCodec(propertyFactory, providerCodec)
    , mapPropertyCodec(propertyFactory, providerCodec)
    , directoryPropertyCodec(filePropertyFactory, providerCodec)
    , regularFilePropertyCodec(filePropertyFactory, providerCodec)
{
}

void Codecs::writeProvider(WriteContext & ctx, const Provider & provider) const
{
    providerCodec.encodeProvider(ctx, provider);
}

ref<const Provider> Codecs::readProvider(ReadContext & ctx) const
{
    return providerCodec.decodeProvider(ctx);
}

void Codecs::writeProperty(WriteContext & ctx, const Property & property) const
{
    auto writeKind = [&](PropertyKind kind) { ctx.writeByte((uint8_t) kind); };

    if (auto p = dynamic_cast<const ScalarProperty *>(&property)) {
        writeKind(PropertyKind::Scalar);
        propertyCodec.encode(ctx, *p);
    } else if (auto p = dynamic_cast<const ListProperty *>(&property)) {
        writeKind(PropertyKind::List);
        listPropertyCodec.encode(ctx, *p);
    } else if (auto p = dynamic_cast<const SetProperty *>(&property)) {
        writeKind(PropertyKind::Set);
        setPropertyCodec.encode(ctx, *p);
    } else if (auto p = dynamic_cast<const MapProperty *>(&property)) {
        writeKind(PropertyKind::Map);
        mapPropertyCodec.encode(ctx, *p);
    } else if (auto p = dynamic_cast<const DirectoryProperty *>(&property)) {
        writeKind(PropertyKind::Directory);
        directoryPropertyCodec.encode(ctx, *p);
    } else if (auto p = dynamic_cast<const RegularFileProperty *>(&property)) {
        writeKind(PropertyKind::RegularFile);
        regularFilePropertyCodec.encode(ctx, *p);
    } else
        throw UnsupportedValueError("cannot write %s to the configuration cache", property.describe());
}

ref<Property> Codecs::readProperty(ReadContext & ctx) const
{
    auto kind = ctx.readByte();

    switch ((PropertyKind) kind) {
    case PropertyKind::Scalar:
        return propertyCodec.decode(ctx);
    case PropertyKind::List:
        return listPropertyCodec.decode(ctx);
    case PropertyKind::Set:
        return setPropertyCodec.decode(ctx);
    case PropertyKind::Map:
        return mapPropertyCodec.decode(ctx);
    case PropertyKind::Directory:
        return directoryPropertyCodec.decode(ctx);
    case PropertyKind::RegularFile:
        return regularFilePropertyCodec.decode(ctx);
    default:
        throw CorruptCacheError("unexpected property kind %d", (unsigned int) kind);
    }
}

} // namespace confcache
