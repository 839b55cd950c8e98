#pragma once
/**
 * @file
 *
 * Utilities for working with the current process's environment
 * variables.
 */

#include <optional>

#include "confcache/util/types.hh"

namespace confcache {

/**
 * @return an environment variable.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Like POSIX `setenv`, but throws a `SysError` on failure.
 */
void setEnv(const std::string & key, const std::string & value);

void unsetEnv(const std::string & key);

} // namespace confcache
