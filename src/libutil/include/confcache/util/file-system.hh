#pragma once
/**
 * @file
 *
 * Utilities for reading and writing whole files.
 */

#include "confcache/util/types.hh"
#include "confcache/util/error.hh"

#include <filesystem>

namespace confcache {

bool pathExists(const std::filesystem::path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const std::filesystem::path & path);

/**
 * Write a string to a file.
 */
void writeFile(const std::filesystem::path & path, std::string_view s);

} // namespace confcache
