#include "confcache/codec/context.hh"
#include "confcache/codec/codec-settings.hh"
#include "confcache/codec/object-codec.hh"
#include "confcache/util/demangle.hh"

namespace confcache {

std::optional<uint64_t> IdentityWriteTable::find(const void * key) const
{
    auto i = ids.find(key);
    if (i == ids.end())
        return std::nullopt;
    return i->second;
}

uint64_t IdentityWriteTable::assign(const void * key, std::shared_ptr<const void> instance)
{
    uint64_t id = instances.size();
    auto [i, inserted] = ids.emplace(key, id);
    if (!inserted)
        throw Error("object is already assigned shared identity %d", i->second);
    instances.push_back(std::move(instance));
    return id;
}

uint64_t IdentityReadTable::reserve(std::type_index type)
{
    slots.push_back(Slot{type, nullptr});
    return slots.size() - 1;
}

void IdentityReadTable::fill(uint64_t id, std::shared_ptr<const void> instance)
{
    if (id >= slots.size() || slots[id].instance)
        throw Error("shared object slot %d is not reserved", id);
    slots[id].instance = std::move(instance);
}

std::shared_ptr<const void> IdentityReadTable::get(uint64_t id, std::type_index type) const
{
    if (id >= slots.size())
        throw CorruptCacheError("unknown shared object id %d", id);
    auto & slot = slots[id];
    if (!slot.instance)
        throw CorruptCacheError("shared object %d refers to itself while it is being read", id);
    if (slot.type != type)
        throw CorruptCacheError(
            "shared object %d has type '%s', not '%s'", id, demangle(slot.type.name()), demangle(type.name()));
    return slot.instance;
}

void WriteContext::write(const Value & v)
{
    objectCodec.writeValue(*this, v);
}

void WriteContext::logPropertyProblem(std::string_view action, const BrokenValue & failure, std::string description)
{
    if (!codecSettings.reportBrokenValues.get())
        return;

    PropertyProblem problem{
        .action = std::string(action),
        .description = std::move(description),
        .message = failure.message(),
    };

    warn("cannot %s %s: %s", problem.action, problem.description, problem.message);

    problems.push_back(std::move(problem));

    if (problems.size() > codecSettings.maxProblems.get())
        throw TooManyProblemsError(
            "maximum number of configuration cache problems (%d) exceeded", codecSettings.maxProblems.get());
}

void WriteContext::finish() const
{
    if (!problems.empty() && codecSettings.failOnProblems.get())
        throw Error("%d configuration cache problems were found", problems.size());
    debug("finished writing %d shared objects with %d problems", identities.size(), problems.size());
}

bool ReadContext::readBoolean()
{
    auto b = readByte();
    if (b > 1)
        throw CorruptCacheError("invalid boolean byte %d", (unsigned int) b);
    return b == 1;
}

std::string ReadContext::readString()
{
    try {
        return confcache::readString(source, codecSettings.maxStringSize.get());
    } catch (SerialisationError & e) {
        throw CorruptCacheError("cannot read string: %s", e.message());
    }
}

Value ReadContext::read()
{
    return objectCodec.readValue(*this);
}

} // namespace confcache
