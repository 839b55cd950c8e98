#pragma once
/**
 * @file
 *
 * Typed, configurable providers: a single value, a list, a set, a map,
 * a directory and a regular file.
 */

#include "confcache/provider/provider.hh"

namespace confcache {

MakeError(PropertyTypeError, Error);

/**
 * A provider whose value is supplied by another provider and checked
 * against the declared type(s) of the property.
 */
class Property : public Provider
{
protected:

    std::shared_ptr<const Provider> provider;

    /**
     * Throw `PropertyTypeError` if `v` does not fit the declared type.
     */
    virtual void checkValue(const Value & v) const = 0;

    virtual std::string kind() const = 0;

public:

    Property();

    /**
     * Set a fixed value. `Null` clears the property.
     */
    void set(Value v);

    void set(ref<const Provider> p);

    ref<const Provider> getProvider() const
    {
        return ref<const Provider>(provider);
    }

    /**
     * Restore the property from a state read back from the cache.
     */
    void fromState(const ExecutionTimeValue & state);

    std::optional<Value> getOrNull() const override;

    /**
     * Unlike the default, failures of the backing provider and values of
     * the wrong type end up as a broken value instead of propagating.
     */
    ExecutionTimeValue calculateExecutionTimeValue() const override;

    std::string describe() const override;
};

class ScalarProperty : public Property
{
    TypeRef type;

protected:

    void checkValue(const Value & v) const override;

    std::string kind() const override;

public:

    ScalarProperty(TypeRef type)
        : type(std::move(type))
    {
    }

    const TypeRef & getType() const
    {
        return type;
    }
};

class ListProperty : public Property
{
    TypeRef elementType;

protected:

    void checkValue(const Value & v) const override;

    std::string kind() const override;

public:

    ListProperty(TypeRef elementType)
        : elementType(std::move(elementType))
    {
    }

    const TypeRef & getElementType() const
    {
        return elementType;
    }
};

class SetProperty : public Property
{
    TypeRef elementType;

protected:

    void checkValue(const Value & v) const override;

    std::string kind() const override;

public:

    SetProperty(TypeRef elementType)
        : elementType(std::move(elementType))
    {
    }

    const TypeRef & getElementType() const
    {
        return elementType;
    }
};

class MapProperty : public Property
{
    TypeRef keyType;
    TypeRef valueType;

protected:

    void checkValue(const Value & v) const override;

    std::string kind() const override;

public:

    MapProperty(TypeRef keyType, TypeRef valueType)
        : keyType(std::move(keyType))
        , valueType(std::move(valueType))
    {
    }

    const TypeRef & getKeyType() const
    {
        return keyType;
    }

    const TypeRef & getValueType() const
    {
        return valueType;
    }
};

class DirectoryProperty : public Property
{
protected:

    void checkValue(const Value & v) const override;

    std::string kind() const override
    {
        return "directory property";
    }
};

class RegularFileProperty : public Property
{
protected:

    void checkValue(const Value & v) const override;

    std::string kind() const override
    {
        return "file property";
    }
};

/**
 * Creates empty properties. Overridable so that callers can observe or
 * decorate the properties being restored from the cache.
 */
class PropertyFactory
{
public:

    virtual ~PropertyFactory() {}

    virtual ref<ScalarProperty> property(const TypeRef & type) const;

    virtual ref<ListProperty> listProperty(const TypeRef & elementType) const;

    virtual ref<SetProperty> setProperty(const TypeRef & elementType) const;

    virtual ref<MapProperty> mapProperty(const TypeRef & keyType, const TypeRef & valueType) const;
};

class FilePropertyFactory
{
public:

    virtual ~FilePropertyFactory() {}

    virtual ref<DirectoryProperty> newDirectoryProperty() const;

    virtual ref<RegularFileProperty> newFileProperty() const;
};

} // namespace confcache
