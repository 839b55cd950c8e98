#pragma once
/**
 * @file
 *
 * Codecs for providers, writing the value of a provider instead of the
 * provider itself wherever that value is already known.
 */

#include "confcache/codec/bindings-codec.hh"
#include "confcache/provider/value-source.hh"
#include "confcache/provider/build-service.hh"

namespace confcache {

/**
 * Writes a value source that has not been obtained yet, so that it can
 * be obtained when the cache is used.
 */
class ValueSourceProviderCodec : public TypedChangingValueCodec<ValueSourceProvider>
{
    ValueSourceProviderFactory & valueSourceProviderFactory;

public:

    ValueSourceProviderCodec(ValueSourceProviderFactory & valueSourceProviderFactory)
        : valueSourceProviderFactory(valueSourceProviderFactory)
    {
    }

    std::string name() const override
    {
        return "value source";
    }

protected:

    /**
     * Throws `BuildLogicInputError` if the source has already been
     * obtained: its value must have been captured as a fixed value.
     */
    void encodeTyped(WriteContext & ctx, ref<const ValueSourceProvider> provider) const override;

    ref<ValueSourceProvider> decodeTyped(ReadContext & ctx) const override;
};

/**
 * Writes how to register a build service again.
 */
class BuildServiceProviderCodec : public TypedChangingValueCodec<BuildServiceProvider>
{
    BuildServiceRegistry & serviceRegistry;

public:

    BuildServiceProviderCodec(BuildServiceRegistry & serviceRegistry)
        : serviceRegistry(serviceRegistry)
    {
    }

    std::string name() const override
    {
        return "build service";
    }

protected:

    void encodeTyped(WriteContext & ctx, ref<const BuildServiceProvider> provider) const override;

    ref<BuildServiceProvider> decodeTyped(ReadContext & ctx) const override;
};

/**
 * Hands the remaining provider shapes to the generic object codec of
 * the pass.
 */
class ObjectProviderCodec : public ChangingValueCodec
{
public:

    std::string name() const override
    {
        return "object";
    }

    bool accepts(const WriteContext & ctx, const Provider & provider) const override;

    void encode(WriteContext & ctx, ref<const Provider> provider) const override;

    ref<const Provider> decode(ReadContext & ctx) const override;
};

class FixedValueReplacingProviderCodec;

/**
 * Writes a provider mapped with a registered transform over a changing
 * source: the name of the transform, then the source. Providers mapped
 * with an anonymous function are not accepted.
 */
class MappedProviderCodec : public TypedChangingValueCodec<MappedProvider>
{
    const FixedValueReplacingProviderCodec & providerCodec;

public:

    MappedProviderCodec(const FixedValueReplacingProviderCodec & providerCodec)
        : providerCodec(providerCodec)
    {
    }

    std::string name() const override
    {
        return "mapped provider";
    }

    bool accepts(const WriteContext & ctx, const Provider & provider) const override;

protected:

    void encodeTyped(WriteContext & ctx, ref<const MappedProvider> provider) const override;

    ref<MappedProvider> decodeTyped(ReadContext & ctx) const override;
};

/**
 * Writes the execution-time value of a provider as a one-byte tag
 * followed by its payload:
 *
 * | tag | state    | payload                             |
 * |-----|----------|-------------------------------------|
 * | 0   | broken   | the failure (see `writeBrokenValue`) |
 * | 1   | missing  | none                                |
 * | 2   | fixed    | the value, with the object codec    |
 * | 3   | changing | the provider, with the bindings     |
 *
 * The bindings are, in this order: value sources, build services,
 * objects, mapped providers.
 */
class FixedValueReplacingProviderCodec
{
    BindingsBackedCodec providerWithChangingValueCodec;

public:

    enum struct Tag : uint8_t {
        Broken = 0,
        Missing = 1,
        Fixed = 2,
        Changing = 3,
    };

    FixedValueReplacingProviderCodec(
        ValueSourceProviderFactory & valueSourceProviderFactory, BuildServiceRegistry & buildServiceRegistry);

    /**
     * Calculate the execution-time value of `provider` and write it. A
     * failure is recorded as a problem and written as a broken value.
     */
    void encodeProvider(WriteContext & ctx, const Provider & provider) const;

    void encodeValue(WriteContext & ctx, const ExecutionTimeValue & value) const;

    ref<const Provider> decodeProvider(ReadContext & ctx) const;

    /**
     * A broken value is read back as a changing provider that raises the
     * failure when evaluated.
     */
    ExecutionTimeValue decodeValue(ReadContext & ctx) const;

    const BindingsBackedCodec & changingValueCodec() const
    {
        return providerWithChangingValueCodec;
    }
};

} // namespace confcache
