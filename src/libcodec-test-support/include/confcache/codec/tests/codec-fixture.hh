#pragma once
///@file

#include <gtest/gtest.h>

#include "confcache/codec/codecs.hh"
#include "confcache/codec/object-codec.hh"
#include "confcache/provider/tests/test-providers.hh"

namespace confcache {

/**
 * Codecs wired to the test collaborators, with helpers to run one
 * encode pass and one decode pass.
 */
class CodecTest : public ::testing::Test
{
protected:

    TestValueSourceProviderFactory valueSources;
    TestBuildServiceRegistry services;
    PropertyFactory propertyFactory;
    FilePropertyFactory filePropertyFactory;
    DefaultObjectCodec objectCodec;
    Codecs codecs{valueSources, services, propertyFactory, filePropertyFactory};

    CodecTest();

    void TearDown() override;

    /**
     * Run `write` in a fresh encode pass and return the bytes written.
     */
    std::string encode(std::function<void(WriteContext &)> write);

    /**
     * Run `read` in a fresh decode pass over `bytes`, and check that it
     * consumed all of them.
     */
    template<typename F>
    auto decode(const std::string & bytes, F && read)
    {
        StringSource source{bytes};
        ReadContext ctx(source, objectCodec);
        auto res = read(ctx);
        EXPECT_TRUE(source.atEnd()) << "decoding left " << (bytes.size() - source.pos) << " bytes";
        return res;
    }

    /**
     * The problems recorded by the last encode pass.
     */
    std::vector<PropertyProblem> problems;
};

/**
 * The encoding of `n` as written by `WriteContext::writeInt()`.
 */
std::string encodedInt(int64_t n);

/**
 * The encoding of `s` as written by `WriteContext::writeString()`.
 */
std::string encodedString(std::string_view s);

} // namespace confcache
