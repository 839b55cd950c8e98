#include <gtest/gtest.h>

#include <unistd.h>

#include "confcache/util/file-system.hh"
#include "confcache/util/environment-variables.hh"

namespace confcache {

namespace {

std::filesystem::path scratchPath(std::string_view name)
{
    return std::filesystem::temp_directory_path()
           / ("confcache-util-tests-" + std::to_string(getpid()) + "-" + std::string(name));
}

} // namespace

/* ----------------------------------------------------------------------------
 * readFile / writeFile
 * --------------------------------------------------------------------------*/

TEST(writeFile, thenReadFile)
{
    auto path = scratchPath("contents");
    writeFile(path, "line one\nline two\n");

    ASSERT_TRUE(pathExists(path));
    ASSERT_EQ(readFile(path), "line one\nline two\n");

    writeFile(path, "");
    ASSERT_EQ(readFile(path), "");

    std::filesystem::remove(path);
    ASSERT_FALSE(pathExists(path));
}

TEST(readFile, missingFileThrows)
{
    ASSERT_THROW(readFile(scratchPath("does-not-exist")), SysError);
}

TEST(pathExists, rootExists)
{
    ASSERT_TRUE(pathExists("/"));
}

/* ----------------------------------------------------------------------------
 * environment variables
 * --------------------------------------------------------------------------*/

TEST(getEnv, setAndUnset)
{
    std::string key = "CONFCACHE_UTIL_TESTS_" + std::to_string(getpid());

    ASSERT_FALSE(getEnv(key).has_value());

    setEnv(key, "value");
    ASSERT_EQ(getEnv(key), "value");

    setEnv(key, "");
    ASSERT_EQ(getEnv(key), "");

    unsetEnv(key);
    ASSERT_FALSE(getEnv(key).has_value());
}

} // namespace confcache
