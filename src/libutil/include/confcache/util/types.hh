#pragma once
///@file

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace confcache {

/**
 * Alias to ordered set container with transparent comparator.
 */
using StringSet = std::set<std::string, std::less<>>;

} // namespace confcache
