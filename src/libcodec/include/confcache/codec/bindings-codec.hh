#pragma once
///@file

#include "confcache/codec/context.hh"

namespace confcache {

/**
 * Writes and reads one shape of changing provider.
 */
class ChangingValueCodec
{
public:

    virtual ~ChangingValueCodec() {}

    virtual std::string name() const = 0;

    /**
     * Whether this codec can write `provider` in the pass of `ctx`.
     */
    virtual bool accepts(const WriteContext & ctx, const Provider & provider) const = 0;

    virtual void encode(WriteContext & ctx, ref<const Provider> provider) const = 0;

    virtual ref<const Provider> decode(ReadContext & ctx) const = 0;
};

/**
 * A `ChangingValueCodec` for the providers of class `T`.
 */
template<typename T>
class TypedChangingValueCodec : public ChangingValueCodec
{
public:

    bool accepts(const WriteContext &, const Provider & provider) const override
    {
        return dynamic_cast<const T *>(&provider) != nullptr;
    }

    void encode(WriteContext & ctx, ref<const Provider> provider) const override
    {
        encodeTyped(ctx, provider.cast<const T>());
    }

    ref<const Provider> decode(ReadContext & ctx) const override
    {
        return decodeTyped(ctx);
    }

protected:

    virtual void encodeTyped(WriteContext & ctx, ref<const T> provider) const = 0;

    virtual ref<T> decodeTyped(ReadContext & ctx) const = 0;
};

/**
 * An ordered list of codecs for changing providers. A provider is
 * written with the first codec that accepts it, preceded by the index of
 * that codec as a single byte. Indices are part of the cache format:
 * codecs may only be appended.
 */
class BindingsBackedCodec
{
    std::vector<ref<ChangingValueCodec>> bindings;

public:

    BindingsBackedCodec(std::vector<ref<ChangingValueCodec>> bindings);

    /**
     * The index of the codec for `provider`. Throws
     * `UnsupportedValueError` if no codec accepts it.
     */
    uint8_t indexOf(const WriteContext & ctx, const Provider & provider) const;

    void encode(WriteContext & ctx, ref<const Provider> provider) const;

    /**
     * Throws `CorruptCacheError` for an index without a codec.
     */
    ref<const Provider> decode(ReadContext & ctx) const;

    size_t size() const
    {
        return bindings.size();
    }
};

} // namespace confcache
