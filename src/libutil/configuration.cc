#include "confcache/util/configuration.hh"
#include "confcache/util/logging.hh"
#include "confcache/util/strings.hh"

#include <nlohmann/json.hpp>

namespace confcache {

void Config::addSetting(AbstractSetting * setting)
{
    if (!settings.emplace(setting->name, setting).second)
        throw Error("setting '%s' is defined twice", setting->name);
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = settings.find(name);
    if (i == settings.end())
        return false;
    i->second->set(value);
    i->second->overridden = true;
    return true;
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    size_t pos = 0;

    while (pos < contents.size()) {
        auto eol = contents.find('\n', pos);
        if (eol == contents.npos)
            eol = contents.size();
        auto line = std::string_view(contents).substr(pos, eol - pos);
        pos = eol + 1;

        if (auto hash = line.find('#'); hash != line.npos)
            line = line.substr(0, hash);

        if (trim(line).empty())
            continue;

        auto eq = line.find('=');
        if (eq == line.npos || trim(line.substr(0, eq)).empty())
            throw UsageError("syntax error in configuration line '%1%' in '%2%'", trim(line), path);

        auto name = trim(line.substr(0, eq));
        if (!set(name, trim(line.substr(eq + 1))))
            warn("unknown setting '%s' in '%s'", name, path);
    }
}

void Config::resetOverridden()
{
    for (auto & [_, setting] : settings)
        setting->overridden = false;
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, setting] : settings)
        res.emplace(name, setting->toJSON());
    return res;
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(stripIndentation(description))
{
}

template<typename T>
T Setting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    if (auto n = string2Int<T>(str))
        return *n;
    throw UsageError("setting '%s' has invalid value '%s'", name, str);
}

template<>
bool Setting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    else if (str == "false" || str == "no" || str == "0")
        return false;
    else
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<typename T>
nlohmann::json Setting<T>::toJSON() const
{
    return {
        {"value", value},
        {"defaultValue", defaultValue},
        {"description", description},
    };
}

template class Setting<bool>;
template class Setting<unsigned int>;
template class Setting<uint64_t>;

} // namespace confcache
