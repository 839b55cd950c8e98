#include "confcache/codec/object-codec.hh"

#include <bit>

namespace confcache {

void DefaultObjectCodec::registerReader(const TypeRef & type, ProviderReader reader)
{
    readers.insert_or_assign(type.name, std::move(reader));
}

void DefaultObjectCodec::writeValue(WriteContext & ctx, const Value & v) const
{
    auto writeTag = [&](Tag tag) { ctx.writeByte((uint8_t) tag); };

    auto writeElems = [&](const std::vector<Value> & elems) {
        ctx.writeSmallInt(elems.size());
        for (auto & e : elems)
            writeValue(ctx, e);
    };

    std::visit(
        overloaded{
            [&](const Null &) { writeTag(Tag::Null); },
            [&](const bool & b) { writeTag(b ? Tag::True : Tag::False); },
            [&](const int64_t & n) {
                writeTag(Tag::Integer);
                ctx.writeInt(n);
            },
            [&](const double & d) {
                writeTag(Tag::Float);
                ctx.writeSmallInt(std::bit_cast<uint64_t>(d));
            },
            [&](const std::string & s) {
                writeTag(Tag::String);
                ctx.writeString(s);
            },
            [&](const DirectoryPath & d) {
                writeTag(Tag::Directory);
                ctx.writeString(d.path.string());
            },
            [&](const RegularFilePath & f) {
                writeTag(Tag::RegularFile);
                ctx.writeString(f.path.string());
            },
            [&](const ValueList & l) {
                writeTag(Tag::List);
                writeElems(l.elems);
            },
            [&](const ValueSet & s) {
                writeTag(Tag::Set);
                writeElems(s.elems);
            },
            [&](const ValueMap & m) {
                writeTag(Tag::Map);
                ctx.writeSmallInt(m.entries.size());
                for (auto & [key, value] : m.entries) {
                    writeValue(ctx, key);
                    writeValue(ctx, value);
                }
            },
            [&](const Handle & h) {
                throw UnsupportedValueError("cannot write %s to the configuration cache", h.description);
            },
        },
        v.raw);
}

Value DefaultObjectCodec::readValue(ReadContext & ctx) const
{
    auto readElems = [&]() {
        std::vector<Value> elems;
        auto n = ctx.readSmallInt();
        for (uint64_t i = 0; i < n; ++i)
            elems.push_back(readValue(ctx));
        return elems;
    };

    auto tag = ctx.readByte();

    switch ((Tag) tag) {

    case Tag::Null:
        return Null{};

    case Tag::False:
        return false;

    case Tag::True:
        return true;

    case Tag::Integer:
        return ctx.readInt();

    case Tag::Float:
        return std::bit_cast<double>(ctx.readSmallInt());

    case Tag::String:
        return ctx.readString();

    case Tag::Directory:
        return DirectoryPath{ctx.readString()};

    case Tag::RegularFile:
        return RegularFilePath{ctx.readString()};

    case Tag::List:
        return ValueList{readElems()};

    case Tag::Set: {
        ValueSet set;
        for (auto & e : readElems()) {
            if (set.contains(e))
                throw CorruptCacheError("set contains the element %s twice", e.to_string());
            set.insert(std::move(e));
        }
        return set;
    }

    case Tag::Map: {
        ValueMap map;
        auto n = ctx.readSmallInt();
        for (uint64_t i = 0; i < n; ++i) {
            auto key = readValue(ctx);
            if (map.get(key))
                throw CorruptCacheError("map contains the key %s twice", key.to_string());
            auto value = readValue(ctx);
            map.put(std::move(key), std::move(value));
        }
        return map;
    }

    default:
        throw CorruptCacheError("unexpected value tag %d", (unsigned int) tag);
    }
}

bool DefaultObjectCodec::acceptsProvider(const Provider & provider) const
{
    auto p = dynamic_cast<const SerialisableProvider *>(&provider);
    return p && readers.contains(p->type().name);
}

void DefaultObjectCodec::writeProvider(WriteContext & ctx, ref<const Provider> provider) const
{
    auto p = provider.dynamic_pointer_cast<const SerialisableProvider>();
    if (!p)
        throw UnsupportedValueError("cannot write %s to the configuration cache", provider->describe());
    encodePreservingSharedIdentityOf(ctx, provider, [&]() {
        ctx.writeClass(p->type());
        writeValue(ctx, p->state());
    });
}

ref<const Provider> DefaultObjectCodec::readProvider(ReadContext & ctx) const
{
    return decodePreservingSharedIdentity<const Provider>(ctx, [&]() {
        auto type = ctx.readClass();
        auto state = readValue(ctx);
        auto i = readers.find(type.name);
        if (i == readers.end())
            throw UnknownTypeError("no reader is registered for providers of type '%s'", type.name);
        return i->second(state);
    });
}

} // namespace confcache
