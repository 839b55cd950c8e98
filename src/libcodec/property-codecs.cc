#include "confcache/codec/property-codecs.hh"

namespace confcache {

void PropertyCodec::encode(WriteContext & ctx, const ScalarProperty & value) const
{
    ctx.writeClass(value.getType());
    providerCodec.encodeProvider(ctx, *value.getProvider());
}

ref<ScalarProperty> PropertyCodec::decode(ReadContext & ctx) const
{
    auto type = ctx.readClass();
    try {
        auto provider = providerCodec.decodeProvider(ctx);
        auto property = factory.property(type);
        property->set(provider);
        return property;
    } catch (Error & e) {
        e.addTrace("while reading a property of type '%s'", type.name);
        throw;
    }
}

void ListPropertyCodec::encode(WriteContext & ctx, const ListProperty & value) const
{
    ctx.writeClass(value.getElementType());
    providerCodec.encodeValue(ctx, value.calculateExecutionTimeValue());
}

ref<ListProperty> ListPropertyCodec::decode(ReadContext & ctx) const
{
    auto elementType = ctx.readClass();
    try {
        auto state = providerCodec.decodeValue(ctx);
        auto property = factory.listProperty(elementType);
        property->fromState(state);
        return property;
    } catch (Error & e) {
        e.addTrace("while reading a list property of element type '%s'", elementType.name);
        throw;
    }
}

void SetPropertyCodec::encode(WriteContext & ctx, const SetProperty & value) const
{
    ctx.writeClass(value.getElementType());
    providerCodec.encodeValue(ctx, value.calculateExecutionTimeValue());
}

ref<SetProperty> SetPropertyCodec::decode(ReadContext & ctx) const
{
    auto elementType = ctx.readClass();
    try {
        auto state = providerCodec.decodeValue(ctx);
        auto property = factory.setProperty(elementType);
        property->fromState(state);
        return property;
    } catch (Error & e) {
        e.addTrace("while reading a set property of element type '%s'", elementType.name);
        throw;
    }
}

void MapPropertyCodec::encode(WriteContext & ctx, const MapProperty & value) const
{
    ctx.writeClass(value.getKeyType());
    ctx.writeClass(value.getValueType());
    providerCodec.encodeValue(ctx, value.calculateExecutionTimeValue());
}

ref<MapProperty> MapPropertyCodec::decode(ReadContext & ctx) const
{
    auto keyType = ctx.readClass();
    auto valueType = ctx.readClass();
    try {
        auto state = providerCodec.decodeValue(ctx);
        auto property = factory.mapProperty(keyType, valueType);
        property->fromState(state);
        return property;
    } catch (Error & e) {
        e.addTrace("while reading a map property of types '%s' and '%s'", keyType.name, valueType.name);
        throw;
    }
}

/**
 * Read the class reference written for a file property, which must be
 * `expected`.
 */
static void expectClass(ReadContext & ctx, const TypeRef & expected)
{
    auto type = ctx.readClass();
    if (type != expected)
        throw CorruptCacheError("expected a property of type '%s', got '%s'", expected.name, type.name);
}

void DirectoryPropertyCodec::encode(WriteContext & ctx, const DirectoryProperty & value) const
{
    ctx.writeClass(TypeRef::directory);
    providerCodec.encodeValue(ctx, value.calculateExecutionTimeValue());
}

ref<DirectoryProperty> DirectoryPropertyCodec::decode(ReadContext & ctx) const
{
    expectClass(ctx, TypeRef::directory);
    try {
        auto state = providerCodec.decodeValue(ctx);
        auto property = factory.newDirectoryProperty();
        property->fromState(state);
        return property;
    } catch (Error & e) {
        e.addTrace("while reading a directory property");
        throw;
    }
}

void RegularFilePropertyCodec::encode(WriteContext & ctx, const RegularFileProperty & value) const
{
    ctx.writeClass(TypeRef::regularFile);
    providerCodec.encodeValue(ctx, value.calculateExecutionTimeValue());
}

ref<RegularFileProperty> RegularFilePropertyCodec::decode(ReadContext & ctx) const
{
    expectClass(ctx, TypeRef::regularFile);
    try {
        auto state = providerCodec.decodeValue(ctx);
        auto property = factory.newFileProperty();
        property->fromState(state);
        return property;
    } catch (Error & e) {
        e.addTrace("while reading a file property");
        throw;
    }
}

} // namespace confcache
