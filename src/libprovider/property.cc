#include "confcache/provider/property.hh"

namespace confcache {

Property::Property()
    : provider(std::make_shared<MissingProvider>())
{
}

void Property::set(Value v)
{
    if (v.isNull()) {
        provider = std::make_shared<MissingProvider>();
        return;
    }
    checkValue(v);
    provider = std::make_shared<FixedProvider>(std::move(v));
}

void Property::set(ref<const Provider> p)
{
    provider = p.get_ptr();
}

void Property::fromState(const ExecutionTimeValue & state)
{
    std::visit(
        overloaded{
            [&](const ExecutionTimeValue::Missing &) { provider = std::make_shared<MissingProvider>(); },
            [&](const ExecutionTimeValue::Fixed & fixed) { set(fixed.value); },
            [&](const ExecutionTimeValue::Changing & changing) { set(changing.provider); },
            [&](const ExecutionTimeValue::Broken & broken) {
                provider = std::make_shared<BrokenProvider>(broken.value);
            },
        },
        state.raw);
}

std::optional<Value> Property::getOrNull() const
{
    auto v = provider->getOrNull();
    if (v)
        checkValue(*v);
    return v;
}

ExecutionTimeValue Property::calculateExecutionTimeValue() const
{
    auto state = ExecutionTimeValue::calculate(*provider);
    if (state.isFixedValue()) {
        try {
            checkValue(state.getFixedValue());
        } catch (PropertyTypeError &) {
            return ExecutionTimeValue::broken(BrokenValue(std::current_exception()));
        }
    }
    return state;
}

std::string Property::describe() const
{
    return kind() + "(" + provider->describe() + ")";
}

static void checkShape(const Value & v, const TypeRef & type, std::string_view what)
{
    if (!type.admits(v))
        throw PropertyTypeError("cannot set %s to %s of type '%s', expected '%s'", what, v.to_string(), v.shapeName(), type.name);
}

void ScalarProperty::checkValue(const Value & v) const
{
    checkShape(v, type, "property");
}

std::string ScalarProperty::kind() const
{
    return "property<" + type.name + ">";
}

void ListProperty::checkValue(const Value & v) const
{
    auto list = std::get_if<ValueList>(&v.raw);
    if (!list)
        throw PropertyTypeError("cannot set list property to %s of type '%s'", v.to_string(), v.shapeName());
    for (auto & elem : list->elems)
        checkShape(elem, elementType, "list element");
}

std::string ListProperty::kind() const
{
    return "list<" + elementType.name + ">";
}

void SetProperty::checkValue(const Value & v) const
{
    auto set = std::get_if<ValueSet>(&v.raw);
    if (!set)
        throw PropertyTypeError("cannot set set property to %s of type '%s'", v.to_string(), v.shapeName());
    for (auto & elem : set->elems)
        checkShape(elem, elementType, "set element");
}

std::string SetProperty::kind() const
{
    return "set<" + elementType.name + ">";
}

void MapProperty::checkValue(const Value & v) const
{
    auto map = std::get_if<ValueMap>(&v.raw);
    if (!map)
        throw PropertyTypeError("cannot set map property to %s of type '%s'", v.to_string(), v.shapeName());
    for (auto & [key, value] : map->entries) {
        checkShape(key, keyType, "map key");
        checkShape(value, valueType, "map value");
    }
}

std::string MapProperty::kind() const
{
    return "map<" + keyType.name + ", " + valueType.name + ">";
}

void DirectoryProperty::checkValue(const Value & v) const
{
    checkShape(v, TypeRef::directory, "directory property");
}

void RegularFileProperty::checkValue(const Value & v) const
{
    checkShape(v, TypeRef::regularFile, "file property");
}

ref<ScalarProperty> PropertyFactory::property(const TypeRef & type) const
{
    return make_ref<ScalarProperty>(type);
}

ref<ListProperty> PropertyFactory::listProperty(const TypeRef & elementType) const
{
    return make_ref<ListProperty>(elementType);
}

ref<SetProperty> PropertyFactory::setProperty(const TypeRef & elementType) const
{
    return make_ref<SetProperty>(elementType);
}

ref<MapProperty> PropertyFactory::mapProperty(const TypeRef & keyType, const TypeRef & valueType) const
{
    return make_ref<MapProperty>(keyType, valueType);
}

ref<DirectoryProperty> FilePropertyFactory::newDirectoryProperty() const
{
    return make_ref<DirectoryProperty>();
}

ref<RegularFileProperty> FilePropertyFactory::newFileProperty() const
{
    return make_ref<RegularFileProperty>();
}

} // namespace confcache
