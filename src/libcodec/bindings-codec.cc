#include "confcache/codec/bindings-codec.hh"

#include <limits>

#include "confcache/util/demangle.hh"

namespace confcache {

BindingsBackedCodec::BindingsBackedCodec(std::vector<ref<ChangingValueCodec>> bindings)
    : bindings(std::move(bindings))
{
    if (this->bindings.size() > std::numeric_limits<uint8_t>::max())
        throw Error("too many codecs for changing values (%d)", this->bindings.size());
}

uint8_t BindingsBackedCodec::indexOf(const WriteContext & ctx, const Provider & provider) const
{
    for (size_t i = 0; i < bindings.size(); ++i)
        if (bindings[i]->accepts(ctx, provider))
            return i;
    throw UnsupportedValueError(
        "cannot write %s to the configuration cache: no codec handles providers of type '%s'",
        provider.describe(),
        demangle(typeid(provider).name()));
}

void BindingsBackedCodec::encode(WriteContext & ctx, ref<const Provider> provider) const
{
    auto index = indexOf(ctx, *provider);
    vomit("writing %s with codec '%s'", provider->describe(), bindings[index]->name());
    ctx.writeByte(index);
    bindings[index]->encode(ctx, provider);
}

ref<const Provider> BindingsBackedCodec::decode(ReadContext & ctx) const
{
    auto index = ctx.readByte();
    if (index >= bindings.size())
        throw CorruptCacheError("unexpected changing value codec %d", (unsigned int) index);
    vomit("reading changing value with codec '%s'", bindings[index]->name());
    return bindings[index]->decode(ctx);
}

} // namespace confcache
