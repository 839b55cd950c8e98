#include "confcache/codec/provider-codecs.hh"
#include "confcache/codec/broken-value-codec.hh"
#include "confcache/codec/object-codec.hh"

#include <limits>

namespace confcache {

void ValueSourceProviderCodec::encodeTyped(WriteContext & ctx, ref<const ValueSourceProvider> provider) const
{
    if (provider->hasBeenObtained())
        throw BuildLogicInputError(
            "%s has already been used as a build logic input, its value should have been written instead",
            provider->describe());

    ctx.writeBoolean(true);
    encodePreservingSharedIdentityOf(ctx, provider, [&]() {
        ctx.writeClass(provider->getValueSourceType());
        ctx.writeClass(provider->getParametersType());
        ctx.write(provider->getParameters());
    });
}

ref<ValueSourceProvider> ValueSourceProviderCodec::decodeTyped(ReadContext & ctx) const
{
    if (!ctx.readBoolean())
        throw CorruptCacheError("unexpected value source encoding");

    return decodePreservingSharedIdentity<ValueSourceProvider>(ctx, [&]() {
        auto valueSourceType = ctx.readClass();
        auto parametersType = ctx.readClass();
        auto parameters = ctx.read();
        return valueSourceProviderFactory.instantiateValueSourceProvider(valueSourceType, parametersType, parameters);
    });
}

void BuildServiceProviderCodec::encodeTyped(WriteContext & ctx, ref<const BuildServiceProvider> provider) const
{
    encodePreservingSharedIdentityOf(ctx, provider, [&]() {
        ctx.writeString(provider->getName());
        ctx.writeClass(provider->getImplementationType());
        ctx.write(provider->getParameters());
        ctx.writeInt(serviceRegistry.usageLimitOf(*provider));
    });
}

ref<BuildServiceProvider> BuildServiceProviderCodec::decodeTyped(ReadContext & ctx) const
{
    return decodePreservingSharedIdentity<BuildServiceProvider>(ctx, [&]() {
        auto name = ctx.readString();
        auto implementationType = ctx.readClass();
        auto parameters = ctx.read();
        auto maxUsages = ctx.readInt();
        if (maxUsages < -1 || maxUsages > std::numeric_limits<int>::max())
            throw CorruptCacheError("build service '%s' has an invalid usage limit %d", name, maxUsages);
        return serviceRegistry.registerService(name, implementationType, parameters, (int) maxUsages);
    });
}

bool ObjectProviderCodec::accepts(const WriteContext & ctx, const Provider & provider) const
{
    return ctx.objectCodec.acceptsProvider(provider);
}

void ObjectProviderCodec::encode(WriteContext & ctx, ref<const Provider> provider) const
{
    ctx.objectCodec.writeProvider(ctx, provider);
}

ref<const Provider> ObjectProviderCodec::decode(ReadContext & ctx) const
{
    return ctx.objectCodec.readProvider(ctx);
}

bool MappedProviderCodec::accepts(const WriteContext & ctx, const Provider & provider) const
{
    auto p = dynamic_cast<const MappedProvider *>(&provider);
    return p && !p->getTransform().empty();
}

void MappedProviderCodec::encodeTyped(WriteContext & ctx, ref<const MappedProvider> provider) const
{
    encodePreservingSharedIdentityOf(ctx, provider, [&]() {
        ctx.writeString(provider->getTransform());
        providerCodec.encodeProvider(ctx, *provider->getSource());
    });
}

ref<MappedProvider> MappedProviderCodec::decodeTyped(ReadContext & ctx) const
{
    return decodePreservingSharedIdentity<MappedProvider>(ctx, [&]() {
        auto transform = ctx.readString();
        auto source = providerCodec.decodeProvider(ctx);
        return make_ref<MappedProvider>(source, transform);
    });
}

FixedValueReplacingProviderCodec::FixedValueReplacingProviderCodec(
    ValueSourceProviderFactory & valueSourceProviderFactory, BuildServiceRegistry & buildServiceRegistry)
    : providerWithChangingValueCodec({
          make_ref<ValueSourceProviderCodec>(valueSourceProviderFactory),
          make_ref<BuildServiceProviderCodec>(buildServiceRegistry),
          make_ref<ObjectProviderCodec>(),
          make_ref<MappedProviderCodec>(*this),
      })
{
}

void FixedValueReplacingProviderCodec::encodeProvider(WriteContext & ctx, const Provider & provider) const
{
    auto state = ExecutionTimeValue::calculate(provider);
    if (state.isBroken())
        ctx.logPropertyProblem("serialize", state.getBrokenValue(), "value " + provider.describe() + " failed to unpack provider");
    encodeValue(ctx, state);
}

void FixedValueReplacingProviderCodec::encodeValue(WriteContext & ctx, const ExecutionTimeValue & value) const
{
    std::visit(
        overloaded{
            [&](const ExecutionTimeValue::Broken & broken) {
                ctx.writeByte((uint8_t) Tag::Broken);
                writeBrokenValue(ctx, broken.value);
            },
            [&](const ExecutionTimeValue::Missing &) { ctx.writeByte((uint8_t) Tag::Missing); },
            [&](const ExecutionTimeValue::Fixed & fixed) {
                ctx.writeByte((uint8_t) Tag::Fixed);
                ctx.write(fixed.value);
            },
            [&](const ExecutionTimeValue::Changing & changing) {
                ctx.writeByte((uint8_t) Tag::Changing);
                providerWithChangingValueCodec.encode(ctx, changing.provider);
            },
        },
        value.raw);
}

ref<const Provider> FixedValueReplacingProviderCodec::decodeProvider(ReadContext & ctx) const
{
    return decodeValue(ctx).toProvider();
}

ExecutionTimeValue FixedValueReplacingProviderCodec::decodeValue(ReadContext & ctx) const
{
    auto tag = ctx.readByte();

    switch ((Tag) tag) {

    case Tag::Broken:
        return ExecutionTimeValue::changingValue(make_ref<BrokenProvider>(readBrokenValue(ctx)));

    case Tag::Missing:
        return ExecutionTimeValue::missing();

    case Tag::Fixed:
        return ExecutionTimeValue::ofNullable(ctx.read());

    case Tag::Changing:
        return ExecutionTimeValue::changingValue(providerWithChangingValueCodec.decode(ctx));

    default:
        throw CorruptCacheError("unexpected provider value tag %d", (unsigned int) tag);
    }
}

} // namespace confcache
