#include "confcache/provider/provider.hh"

#include <sstream>

namespace confcache {

void BrokenValue::rethrow() const
{
    std::rethrow_exception(failure);
}

std::string BrokenValue::message() const
{
    try {
        std::rethrow_exception(failure);
    } catch (BaseError & e) {
        return e.message();
    } catch (std::exception & e) {
        return e.what();
    }
}

ExecutionTimeValue ExecutionTimeValue::ofNullable(Value value)
{
    if (value.isNull())
        return missing();
    return fixedValue(std::move(value));
}

ExecutionTimeValue ExecutionTimeValue::calculate(const Provider & provider)
{
    try {
        return provider.calculateExecutionTimeValue();
    } catch (std::bad_weak_ptr &) {
        // A provider that is not owned by a `ref` is a programming error.
        throw;
    } catch (std::exception &) {
        return broken(BrokenValue(std::current_exception()));
    }
}

const Value & ExecutionTimeValue::getFixedValue() const
{
    if (auto fixed = std::get_if<Fixed>(&raw))
        return fixed->value;
    throw Error("execution-time value is not fixed");
}

ref<const Provider> ExecutionTimeValue::getChangingValue() const
{
    if (auto changing = std::get_if<Changing>(&raw))
        return changing->provider;
    throw Error("execution-time value is not changing");
}

const BrokenValue & ExecutionTimeValue::getBrokenValue() const
{
    if (auto broken = std::get_if<Broken>(&raw))
        return broken->value;
    throw Error("execution-time value is not broken");
}

ref<const Provider> ExecutionTimeValue::toProvider() const
{
    return std::visit(
        overloaded{
            [](const Missing &) -> ref<const Provider> { return make_ref<MissingProvider>(); },
            [](const Fixed & fixed) -> ref<const Provider> { return make_ref<FixedProvider>(fixed.value); },
            [](const Changing & changing) -> ref<const Provider> { return changing.provider; },
            [](const Broken & broken) -> ref<const Provider> { return make_ref<BrokenProvider>(broken.value); },
        },
        raw);
}

Value Provider::get() const
{
    auto v = getOrNull();
    if (!v)
        throw MissingValueError("cannot query the value of %s because it has no value available", describe());
    return std::move(*v);
}

ExecutionTimeValue Provider::calculateExecutionTimeValue() const
{
    auto v = getOrNull();
    if (!v)
        return ExecutionTimeValue::missing();
    return ExecutionTimeValue::fixedValue(std::move(*v));
}

ref<const Provider> Provider::map(std::function<Value(const Value &)> f) const
{
    return make_ref<MappedProvider>(self(), std::move(f));
}

ref<const Provider> Provider::map(const std::string & transform) const
{
    return make_ref<MappedProvider>(self(), transform);
}

std::string FixedProvider::describe() const
{
    return "fixed(" + value.to_string() + ")";
}

std::optional<Value> DefaultProvider::getOrNull() const
{
    auto v = fun();
    if (v.isNull())
        return std::nullopt;
    return v;
}

Transforms::Map & Transforms::transforms()
{
    static Map transforms;
    return transforms;
}

void Transforms::add(const std::string & name, Fun fun)
{
    transforms().insert_or_assign(name, std::move(fun));
}

const Transforms::Fun & Transforms::get(const std::string & name)
{
    auto i = transforms().find(name);
    if (i == transforms().end())
        throw UnknownTypeError("no transform named '%s' is registered", name);
    return i->second;
}

std::optional<Value> MappedProvider::getOrNull() const
{
    auto v = source->getOrNull();
    if (!v)
        return std::nullopt;
    auto res = f(*v);
    if (res.isNull())
        return std::nullopt;
    return res;
}

ExecutionTimeValue MappedProvider::calculateExecutionTimeValue() const
{
    auto state = source->calculateExecutionTimeValue();
    if (state.isFixedValue())
        return ExecutionTimeValue::ofNullable(f(state.getFixedValue()));
    if (state.isChangingValue())
        return ExecutionTimeValue::changingValue(self());
    return state;
}

std::string MappedProvider::describe() const
{
    return "map(" + source->describe() + ")";
}

std::string BrokenProvider::describe() const
{
    return "broken(" + value.message() + ")";
}

std::ostream & operator<<(std::ostream & str, const Provider & p)
{
    return str << p.describe();
}

} // namespace confcache
