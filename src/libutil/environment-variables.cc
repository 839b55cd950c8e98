#include <cstdlib>

#include "confcache/util/environment-variables.hh"
#include "confcache/util/error.hh"

namespace confcache {

std::optional<std::string> getEnv(const std::string & key)
{
    char * value = getenv(key.c_str());
    if (!value)
        return {};
    return std::string(value);
}

void setEnv(const std::string & key, const std::string & value)
{
    if (::setenv(key.c_str(), value.c_str(), 1) == -1)
        throw SysError("setting environment variable '%s'", key);
}

void unsetEnv(const std::string & key)
{
    if (::unsetenv(key.c_str()) == -1)
        throw SysError("unsetting environment variable '%s'", key);
}

} // namespace confcache
