#pragma once
/**
 * @file
 *
 * Writing captured failures to a cache stream, and rebuilding them as
 * exceptions of the same type when they are read back.
 */

#include <map>

#include "confcache/codec/context.hh"
#include "confcache/util/demangle.hh"

namespace confcache {

/**
 * Registry of the exception types that a broken value can be rebuilt
 * as, keyed by demangled type name.
 */
struct ErrorKinds
{
    typedef std::function<std::exception_ptr(ErrorInfo && info)> Rebuild;

    typedef std::map<std::string, Rebuild> Map;

    static Map & kinds();

    static void add(const std::string & kind, Rebuild rebuild);

    /**
     * An exception of the registered type, or a plain `Error` with the
     * same message and traces if `kind` is not registered.
     */
    static std::exception_ptr rebuild(const std::string & kind, ErrorInfo && info);
};

/**
 * Register an exception type derived from `BaseError`. Use as a static
 * variable:
 *
 *     static RegisterErrorKind<MyError> rMyError;
 */
template<typename T>
struct RegisterErrorKind
{
    RegisterErrorKind()
    {
        ErrorKinds::add(
            demangle(typeid(T).name()), [](ErrorInfo && info) { return std::make_exception_ptr(T(std::move(info))); });
    }
};

/**
 * Write the kind of the captured failure followed by the failure itself
 * in the error wire format.
 */
void writeBrokenValue(WriteContext & ctx, const BrokenValue & value);

BrokenValue readBrokenValue(ReadContext & ctx);

} // namespace confcache
