#include "confcache/codec/tests/codec-fixture.hh"
#include "confcache/codec/codec-settings.hh"

namespace confcache {

CodecTest::CodecTest()
{
    objectCodec.registerReader(GreetingProvider::greetingType, [](const Value & state) -> ref<const Provider> {
        return make_ref<GreetingProvider>(std::get<std::string>(state.raw));
    });
}

void CodecTest::TearDown()
{
    codecSettings.resetOverridden();
    codecSettings.reportBrokenValues = true;
    codecSettings.maxProblems = 512;
    codecSettings.failOnProblems = false;
    codecSettings.maxStringSize = 64 * 1024 * 1024;
}

std::string CodecTest::encode(std::function<void(WriteContext &)> write)
{
    StringSink sink;
    WriteContext ctx(sink, objectCodec);
    write(ctx);
    ctx.finish();
    problems = ctx.problems;
    return std::move(sink.s);
}

std::string encodedInt(int64_t n)
{
    StringSink sink;
    sink << (uint64_t) n;
    return std::move(sink.s);
}

std::string encodedString(std::string_view s)
{
    StringSink sink;
    writeString(s, sink);
    return std::move(sink.s);
}

} // namespace confcache
