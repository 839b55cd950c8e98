#include "confcache/codec/broken-value-codec.hh"
#include "confcache/codec/codec-settings.hh"
#include "confcache/provider/property.hh"
#include "confcache/provider/build-service.hh"

#include <stdexcept>

namespace confcache {

template<typename T>
static ErrorKinds::Rebuild rebuildStd()
{
    return [](ErrorInfo && info) { return std::make_exception_ptr(T(info.msg.str())); };
}

template<typename T>
static ErrorKinds::Rebuild rebuildError()
{
    return [](ErrorInfo && info) { return std::make_exception_ptr(T(std::move(info))); };
}

ErrorKinds::Map & ErrorKinds::kinds()
{
    static Map kinds{
        {demangle(typeid(Error).name()), rebuildError<Error>()},
        {demangle(typeid(UsageError).name()), rebuildError<UsageError>()},
        {demangle(typeid(SystemError).name()), rebuildError<SystemError>()},
        {demangle(typeid(SysError).name()), rebuildError<SystemError>()},
        {demangle(typeid(MissingValueError).name()), rebuildError<MissingValueError>()},
        {demangle(typeid(UnknownTypeError).name()), rebuildError<UnknownTypeError>()},
        {demangle(typeid(PropertyTypeError).name()), rebuildError<PropertyTypeError>()},
        {demangle(typeid(UsageLimitError).name()), rebuildError<UsageLimitError>()},
        {demangle(typeid(std::runtime_error).name()), rebuildStd<std::runtime_error>()},
        {demangle(typeid(std::logic_error).name()), rebuildStd<std::logic_error>()},
        {demangle(typeid(std::invalid_argument).name()), rebuildStd<std::invalid_argument>()},
        {demangle(typeid(std::out_of_range).name()), rebuildStd<std::out_of_range>()},
        {demangle(typeid(std::overflow_error).name()), rebuildStd<std::overflow_error>()},
    };
    return kinds;
}

void ErrorKinds::add(const std::string & kind, Rebuild rebuild)
{
    kinds().insert_or_assign(kind, std::move(rebuild));
}

std::exception_ptr ErrorKinds::rebuild(const std::string & kind, ErrorInfo && info)
{
    auto i = kinds().find(kind);
    if (i == kinds().end()) {
        debug("replaying failure of unknown kind '%s' as a plain error", kind);
        return std::make_exception_ptr(Error(std::move(info)));
    }
    return i->second(std::move(info));
}

void writeBrokenValue(WriteContext & ctx, const BrokenValue & value)
{
    std::string kind;
    std::optional<Error> error;

    try {
        value.rethrow();
    } catch (BaseError & e) {
        kind = demangle(typeid(e).name());
        error.emplace(e.info());
    } catch (std::exception & e) {
        kind = demangle(typeid(e).name());
        error.emplace(ErrorInfo{.level = lvlError, .msg = HintFmt(std::string(e.what()))});
    }

    vomit("writing broken value of kind '%s'", kind);
    ctx.writeString(kind);
    ctx.sink << *error;
}

BrokenValue readBrokenValue(ReadContext & ctx)
{
    auto kind = ctx.readString();
    auto info = [&]() {
        try {
            return readErrorInfo(ctx.source, codecSettings.maxStringSize.get());
        } catch (SerialisationError & e) {
            throw CorruptCacheError("cannot read failure of kind '%s': %s", kind, e.message());
        }
    }();
    return BrokenValue(ErrorKinds::rebuild(kind, std::move(info)));
}

} // namespace confcache
