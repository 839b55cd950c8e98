#include <cerrno>
#include <cstring>
#include <sstream>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "confcache/util/error.hh"

namespace confcache {

using testing::HasSubstr;
using testing::Not;

MakeError(TestError, Error);

TEST(BaseError, messageWithoutArguments)
{
    TestError e("a plain message with a stray % sign");
    ASSERT_EQ(e.message(), "a plain message with a stray % sign");
}

TEST(BaseError, argumentsAreInterpolated)
{
    TestError e("property '%s' has %d problems", "compilerArgs", 3);
    ASSERT_THAT(e.message(), HasSubstr("compilerArgs"));
    ASSERT_THAT(e.message(), HasSubstr("3"));
}

TEST(BaseError, whatCarriesThePrefix)
{
    TestError e("boom");
    ASSERT_THAT(std::string(e.what()), HasSubstr("error:"));
    ASSERT_THAT(std::string(e.what()), HasSubstr("boom"));
}

TEST(BaseError, canBeCaughtAsError)
{
    try {
        throw TestError("boom");
    } catch (Error & e) {
        ASSERT_EQ(e.message(), "boom");
        return;
    }
    FAIL() << "TestError was not caught as Error";
}

TEST(BaseError, addTracePrependsContext)
{
    TestError e("corrupt");
    ASSERT_FALSE(e.hasTrace());

    e.addTrace("while reading property '%s'", "inner");
    e.addTrace("while reading property '%s'", "outer");
    ASSERT_TRUE(e.hasTrace());

    auto & traces = e.info().traces;
    ASSERT_EQ(traces.size(), 2u);
    ASSERT_THAT(traces.front().hint.str(), HasSubstr("outer"));
    ASSERT_THAT(traces.back().hint.str(), HasSubstr("inner"));

    ASSERT_THAT(std::string(e.what()), HasSubstr("inner"));
}

TEST(SysError, includesStrerror)
{
    SysError e(ENOENT, "opening file '%s'", "/nonexistent");
    ASSERT_THAT(e.message(), HasSubstr("/nonexistent"));
    ASSERT_THAT(e.message(), HasSubstr(strerror(ENOENT)));
}

TEST(showErrorInfo, traceIsTruncated)
{
    ErrorInfo info{.level = lvlError, .msg = HintFmt("innermost")};
    for (int i = 0; i < 5; ++i)
        info.traces.push_back(Trace{.hint = HintFmt("frame-" + std::to_string(i))});

    std::ostringstream truncated;
    showErrorInfo(truncated, info, false);
    ASSERT_THAT(truncated.str(), HasSubstr("trace truncated"));
    ASSERT_THAT(truncated.str(), Not(HasSubstr("frame-4")));

    std::ostringstream full;
    showErrorInfo(full, info, true);
    ASSERT_THAT(full.str(), Not(HasSubstr("trace truncated")));
    ASSERT_THAT(full.str(), HasSubstr("frame-4"));
}

TEST(showErrorInfo, warningPrefix)
{
    ErrorInfo info{.level = lvlWarn, .msg = HintFmt("careful")};

    std::ostringstream out;
    showErrorInfo(out, info, false);
    ASSERT_THAT(out.str(), HasSubstr("warning:"));
    ASSERT_THAT(out.str(), HasSubstr("careful"));
}

} // namespace confcache
