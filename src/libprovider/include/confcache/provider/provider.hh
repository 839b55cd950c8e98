#pragma once
/**
 * @file
 *
 * Deferred computations of configuration values, and their resolution
 * into an execution-time value.
 */

#include <exception>
#include <functional>
#include <map>

#include "confcache/util/ref.hh"
#include "confcache/provider/value.hh"

namespace confcache {

MakeError(MissingValueError, Error);
MakeError(UnknownTypeError, Error);

class Provider;

/**
 * A failure captured while computing a value. The failure is kept
 * until someone consumes the value, at which point `rethrow()` raises
 * it again.
 */
struct BrokenValue
{
    std::exception_ptr failure;

    explicit BrokenValue(std::exception_ptr failure)
        : failure(std::move(failure))
    {
    }

    [[noreturn]] void rethrow() const;

    /**
     * The message of the captured failure.
     */
    std::string message() const;
};

/**
 * The resolved state of a provider at the moment its value is written
 * to the cache. Exactly one of the cases applies.
 */
struct ExecutionTimeValue
{
    /**
     * No value is available.
     */
    struct Missing
    {
    };

    /**
     * A constant. The provider that produced it can be discarded.
     */
    struct Fixed
    {
        Value value;
    };

    /**
     * A value that can only be computed later, so the provider itself
     * must be kept.
     */
    struct Changing
    {
        ref<const Provider> provider;
    };

    /**
     * Computing the value failed.
     */
    struct Broken
    {
        BrokenValue value;
    };

    using Raw = std::variant<Missing, Fixed, Changing, Broken>;
    Raw raw;

    MAKE_WRAPPER_CONSTRUCTOR(ExecutionTimeValue);

    static ExecutionTimeValue missing()
    {
        return Missing{};
    }

    static ExecutionTimeValue fixedValue(Value value)
    {
        return Fixed{std::move(value)};
    }

    /**
     * Like `fixedValue()`, but a null value becomes missing.
     */
    static ExecutionTimeValue ofNullable(Value value);

    static ExecutionTimeValue changingValue(ref<const Provider> provider)
    {
        return Changing{std::move(provider)};
    }

    static ExecutionTimeValue broken(BrokenValue value)
    {
        return Broken{std::move(value)};
    }

    /**
     * Resolve `provider`, capturing any failure as a broken value.
     * `std::bad_weak_ptr` from a provider not owned by a `ref`
     * propagates.
     */
    static ExecutionTimeValue calculate(const Provider & provider);

    bool isMissing() const
    {
        return std::holds_alternative<Missing>(raw);
    }

    bool isFixedValue() const
    {
        return std::holds_alternative<Fixed>(raw);
    }

    bool isChangingValue() const
    {
        return std::holds_alternative<Changing>(raw);
    }

    bool isBroken() const
    {
        return std::holds_alternative<Broken>(raw);
    }

    const Value & getFixedValue() const;

    ref<const Provider> getChangingValue() const;

    const BrokenValue & getBrokenValue() const;

    /**
     * A provider that produces this value when evaluated.
     */
    ref<const Provider> toProvider() const;
};

/**
 * A deferred computation of a `Value`. Providers are immutable once
 * shared (apart from the typed properties, which are configured before
 * they are handed out) and are always owned by a `ref`.
 */
class Provider : public std::enable_shared_from_this<Provider>
{
public:

    virtual ~Provider() {}

    /**
     * Compute the value, or `std::nullopt` if the provider has no value.
     * Failures of the underlying computation propagate.
     */
    virtual std::optional<Value> getOrNull() const = 0;

    /**
     * Like `getOrNull()`, but throws `MissingValueError` if there is no value.
     */
    Value get() const;

    bool isPresent() const
    {
        return getOrNull().has_value();
    }

    /**
     * Classify this provider for writing to the cache. The default
     * evaluates eagerly and returns a fixed or missing value.
     */
    virtual ExecutionTimeValue calculateExecutionTimeValue() const;

    virtual std::string describe() const = 0;

    /**
     * A provider that applies `f` to the value of this one.
     */
    ref<const Provider> map(std::function<Value(const Value &)> f) const;

    /**
     * Like `map(f)`, with the function registered as `transform`. Unlike
     * an anonymous function, a named transform can be written to the
     * cache while this provider is still changing.
     */
    ref<const Provider> map(const std::string & transform) const;

    ref<const Provider> self() const
    {
        return ref<const Provider>(shared_from_this());
    }
};

class FixedProvider : public Provider
{
    Value value;

public:

    FixedProvider(Value value)
        : value(std::move(value))
    {
    }

    std::optional<Value> getOrNull() const override
    {
        return value;
    }

    std::string describe() const override;
};

class MissingProvider : public Provider
{
public:

    std::optional<Value> getOrNull() const override
    {
        return std::nullopt;
    }

    std::string describe() const override
    {
        return "missing";
    }
};

/**
 * A provider backed by a function, evaluated on every access. A `Null`
 * result means the provider has no value.
 */
class DefaultProvider : public Provider
{
    std::function<Value()> fun;

public:

    DefaultProvider(std::function<Value()> fun)
        : fun(std::move(fun))
    {
    }

    std::optional<Value> getOrNull() const override;

    std::string describe() const override
    {
        return "provider(?)";
    }
};

/**
 * Named functions from value to value, so that a mapped provider can be
 * rebuilt when it is read back from a cache.
 */
struct Transforms
{
    typedef std::function<Value(const Value &)> Fun;

    typedef std::map<std::string, Fun> Map;

    static Map & transforms();

    static void add(const std::string & name, Fun fun);

    /**
     * Throws `UnknownTypeError` if there is no transform `name`.
     */
    static const Fun & get(const std::string & name);
};

/**
 * Register a transform. Use as a static variable:
 *
 *     static RegisterTransform rUpper("upper", [](const Value & v) { ... });
 */
struct RegisterTransform
{
    RegisterTransform(const std::string & name, Transforms::Fun fun)
    {
        Transforms::add(name, std::move(fun));
    }
};

class MappedProvider : public Provider
{
    ref<const Provider> source;
    std::function<Value(const Value &)> f;

    /**
     * Empty for an anonymous function.
     */
    std::string transform;

public:

    MappedProvider(ref<const Provider> source, std::function<Value(const Value &)> f)
        : source(std::move(source))
        , f(std::move(f))
    {
    }

    MappedProvider(ref<const Provider> source, const std::string & transform)
        : source(std::move(source))
        , f(Transforms::get(transform))
        , transform(transform)
    {
    }

    ref<const Provider> getSource() const
    {
        return source;
    }

    const std::string & getTransform() const
    {
        return transform;
    }

    std::optional<Value> getOrNull() const override;

    /**
     * Fixed when the source is fixed; otherwise this provider is
     * changing too.
     */
    ExecutionTimeValue calculateExecutionTimeValue() const override;

    std::string describe() const override;
};

/**
 * Placeholder for a value whose computation failed. Evaluating it raises
 * the captured failure.
 */
class BrokenProvider : public Provider
{
    BrokenValue value;

public:

    BrokenProvider(BrokenValue value)
        : value(std::move(value))
    {
    }

    std::optional<Value> getOrNull() const override
    {
        value.rethrow();
    }

    std::string describe() const override;
};

/**
 * A changing provider whose state can be written by the generic object
 * codec and rebuilt by a reader registered for its type.
 */
class SerialisableProvider : public Provider
{
public:

    virtual TypeRef type() const = 0;

    /**
     * The state the provider is rebuilt from.
     */
    virtual Value state() const = 0;

    ExecutionTimeValue calculateExecutionTimeValue() const override
    {
        return ExecutionTimeValue::changingValue(self());
    }
};

std::ostream & operator<<(std::ostream & str, const Provider & p);

} // namespace confcache
