#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <utility>

#include "confcache/util/logging.hh"

namespace confcache {

using testing::ElementsAre;
using testing::HasSubstr;

namespace {

class CapturingLogger : public Logger
{
public:
    std::vector<std::pair<Verbosity, std::string>> lines;

    void log(Verbosity lvl, std::string_view s) override
    {
        lines.emplace_back(lvl, std::string(s));
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());
        log(ei.level, oss.str());
    }
};

class LoggingTest : public ::testing::Test
{
protected:
    CapturingLogger * capture;
    std::unique_ptr<Logger> saved;
    Verbosity savedVerbosity;

    void SetUp() override
    {
        auto l = std::make_unique<CapturingLogger>();
        capture = l.get();
        saved = std::exchange(logger, std::move(l));
        savedVerbosity = verbosity;
    }

    void TearDown() override
    {
        logger = std::move(saved);
        verbosity = savedVerbosity;
    }
};

} // namespace

TEST_F(LoggingTest, warnHasPrefix)
{
    warn("property '%s' could not be stored", "outputDir");

    ASSERT_EQ(capture->lines.size(), 1u);
    ASSERT_EQ(capture->lines[0].first, lvlWarn);
    ASSERT_THAT(capture->lines[0].second, HasSubstr("warning:"));
    ASSERT_THAT(capture->lines[0].second, HasSubstr("outputDir"));
}

TEST_F(LoggingTest, messagesAboveVerbosityAreDropped)
{
    verbosity = lvlInfo;

    int evaluated = 0;
    auto expensive = [&]() {
        evaluated++;
        return std::string("details");
    };

    debug("decoded %s", expensive());
    printInfo("visible");

    ASSERT_EQ(evaluated, 0);
    ASSERT_EQ(capture->lines.size(), 1u);
    ASSERT_EQ(capture->lines[0].second, "visible");
}

TEST_F(LoggingTest, debugIsShownAtDebugVerbosity)
{
    verbosity = lvlDebug;

    debug("decoded %d properties", 3);
    vomit("not shown");

    ASSERT_EQ(capture->lines.size(), 1u);
    ASSERT_EQ(capture->lines[0].second, "decoded 3 properties");
}

TEST_F(LoggingTest, logErrorFormatsErrorInfo)
{
    Error e("cache entry is corrupt");
    e.addTrace("while reading a property");

    logError(e.info());

    ASSERT_EQ(capture->lines.size(), 1u);
    ASSERT_EQ(capture->lines[0].first, lvlError);
    ASSERT_THAT(capture->lines[0].second, HasSubstr("error:"));
    ASSERT_THAT(capture->lines[0].second, HasSubstr("while reading a property"));
    ASSERT_THAT(capture->lines[0].second, HasSubstr("cache entry is corrupt"));
}

TEST_F(LoggingTest, logWarningOverridesLevel)
{
    logWarning(ErrorInfo{.level = lvlError, .msg = HintFmt("deprecated format")});

    std::vector<Verbosity> levels;
    for (auto & [lvl, _] : capture->lines)
        levels.push_back(lvl);
    ASSERT_THAT(levels, ElementsAre(lvlWarn));
}

} // namespace confcache
