#pragma once
/**
 * @file
 *
 * The state of one encode or decode pass over a cache stream.
 */

#include <typeindex>
#include <unordered_map>

#include "confcache/util/serialise.hh"
#include "confcache/util/logging.hh"
#include "confcache/provider/provider.hh"
#include "confcache/codec/problems.hh"

namespace confcache {

/**
 * The stream does not follow the cache format.
 */
MakeError(CorruptCacheError, Error);

/**
 * A changing value none of the codecs knows how to write.
 */
MakeError(UnsupportedValueError, Error);

/**
 * A value source that was already used as an input of the build logic
 * reached the cache as a provider.
 */
MakeError(BuildLogicInputError, Error);

MakeError(TooManyProblemsError, Error);

class ObjectCodec;

/**
 * Assigns ids to the objects written with shared identity, in the order
 * they are first written.
 */
class IdentityWriteTable
{
    std::unordered_map<const void *, uint64_t> ids;

    /**
     * Keeps the objects alive so that their addresses are not reused
     * during the pass.
     */
    std::vector<std::shared_ptr<const void>> instances;

public:

    std::optional<uint64_t> find(const void * key) const;

    uint64_t assign(const void * key, std::shared_ptr<const void> instance);

    size_t size() const
    {
        return instances.size();
    }
};

/**
 * Resolves the ids read from a stream to the objects decoded for them.
 * A slot is reserved before the object is decoded, so that ids nested
 * in its body line up with the ids assigned while writing.
 */
class IdentityReadTable
{
    struct Slot
    {
        std::type_index type;
        std::shared_ptr<const void> instance;
    };

    std::vector<Slot> slots;

public:

    size_t size() const
    {
        return slots.size();
    }

    uint64_t reserve(std::type_index type);

    void fill(uint64_t id, std::shared_ptr<const void> instance);

    /**
     * Throws `CorruptCacheError` if the slot is still being decoded or
     * holds an object of another type.
     */
    std::shared_ptr<const void> get(uint64_t id, std::type_index type) const;
};

class WriteContext
{
public:

    Sink & sink;
    const ObjectCodec & objectCodec;
    IdentityWriteTable identities;
    std::vector<PropertyProblem> problems;

    WriteContext(Sink & sink, const ObjectCodec & objectCodec)
        : sink(sink)
        , objectCodec(objectCodec)
    {
    }

    WriteContext(const WriteContext &) = delete;

    void writeByte(uint8_t b)
    {
        confcache::writeByte(b, sink);
    }

    void writeBoolean(bool b)
    {
        writeByte(b ? 1 : 0);
    }

    void writeInt(int64_t n)
    {
        sink << (uint64_t) n;
    }

    void writeSmallInt(uint64_t n)
    {
        sink << n;
    }

    void writeString(std::string_view s)
    {
        confcache::writeString(s, sink);
    }

    void writeClass(const TypeRef & type)
    {
        writeString(type.name);
    }

    /**
     * Write a value with the generic object codec.
     */
    void write(const Value & v);

    /**
     * Record that `description` could not be handled while doing
     * `action`. Throws `TooManyProblemsError` once more problems than
     * `max-problems` were recorded.
     */
    void logPropertyProblem(std::string_view action, const BrokenValue & failure, std::string description);

    /**
     * End the pass. Throws if problems were recorded and
     * `fail-on-problems` is set.
     */
    void finish() const;
};

class ReadContext
{
public:

    Source & source;
    const ObjectCodec & objectCodec;
    IdentityReadTable identities;

    ReadContext(Source & source, const ObjectCodec & objectCodec)
        : source(source)
        , objectCodec(objectCodec)
    {
    }

    ReadContext(const ReadContext &) = delete;

    uint8_t readByte()
    {
        return confcache::readByte(source);
    }

    /**
     * Throws `CorruptCacheError` for a byte other than 0 or 1.
     */
    bool readBoolean();

    int64_t readInt()
    {
        return (int64_t) readNum<uint64_t>(source);
    }

    uint64_t readSmallInt()
    {
        return readNum<uint64_t>(source);
    }

    std::string readString();

    TypeRef readClass()
    {
        return TypeRef{readString()};
    }

    Value read();
};

/**
 * Write `value` once per pass. The first time, an id is assigned and
 * written, followed by whatever `writeBody` writes. Later occurrences of
 * the same instance only write the id.
 */
template<typename T>
void encodePreservingSharedIdentityOf(WriteContext & ctx, const ref<T> & value, std::function<void()> writeBody)
{
    auto key = dynamic_cast<const void *>(&*value);
    if (auto id = ctx.identities.find(key)) {
        vomit("writing shared object %d again", *id);
        ctx.writeSmallInt(*id);
        return;
    }
    auto id = ctx.identities.assign(key, value.get_ptr());
    ctx.writeSmallInt(id);
    writeBody();
}

/**
 * The counterpart of `encodePreservingSharedIdentityOf()`. `readBody` is
 * only called for the first occurrence of an id.
 */
template<typename T>
ref<T> decodePreservingSharedIdentity(ReadContext & ctx, std::function<ref<T>()> readBody)
{
    auto id = ctx.readSmallInt();
    if (id < ctx.identities.size()) {
        vomit("reading shared object %d again", id);
        auto instance = ctx.identities.get(id, typeid(T));
        return ref<T>(std::const_pointer_cast<T>(std::static_pointer_cast<const T>(instance)));
    }
    if (id > ctx.identities.size())
        throw CorruptCacheError("shared object id %d is out of order, expected %d", id, ctx.identities.size());
    ctx.identities.reserve(typeid(T));
    auto value = readBody();
    ctx.identities.fill(id, value.get_ptr());
    return value;
}

} // namespace confcache
