#pragma once
///@file

#include <cstdint>
#include <map>

#include <nlohmann/json_fwd.hpp>

#include "confcache/util/types.hh"

namespace confcache {

class AbstractSetting;

/**
 * A set of uniquely named settings. The typical use is to inherit
 * `Config` and add `Setting<T>` members, which register themselves:
 *
 *     struct CodecSettings : Config
 *     {
 *         Setting<unsigned int> maxProblems{this, 512, "max-problems", "the number of problems to tolerate"};
 *     };
 */
class Config
{
    std::map<std::string, AbstractSetting *> settings;

public:

    virtual ~Config() = default;

    void addSetting(AbstractSetting * setting);

    /**
     * Set the setting `name` from its textual form and mark it as
     * overridden. Returns false if there is no such setting; throws
     * `UsageError` if `value` is not valid for it.
     */
    bool set(const std::string & name, const std::string & value);

    /**
     * Apply `name = value` lines. Everything after a `#` is a comment.
     * Unknown settings are reported with `warn()`.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    void resetOverridden();

    /**
     * Every setting with its value, default and description.
     */
    nlohmann::json toJSON() const;
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;

    bool overridden = false;

protected:

    AbstractSetting(const std::string & name, const std::string & description);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & str) = 0;

    virtual nlohmann::json toJSON() const = 0;
};

/**
 * A setting of type T. Booleans and unsigned integers are supported.
 */
template<typename T>
class Setting : public AbstractSetting
{
    T value;
    const T defaultValue;

    T parse(const std::string & str) const;

public:

    Setting(Config * config, const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    {
        config->addSetting(this);
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
    }

    void set(const std::string & str) override
    {
        value = parse(str);
    }

    nlohmann::json toJSON() const override;
};

} // namespace confcache
