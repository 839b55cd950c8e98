#include "confcache/util/serialise.hh"

#include <cstring>

namespace confcache {

void Source::operator()(char * data, size_t len)
{
    while (len) {
        size_t n = read(data, len);
        data += n;
        len -= n;
    }
}

void StringSink::operator()(std::string_view data)
{
    s.append(data);
}

size_t StringSource::read(char * data, size_t len)
{
    if (pos == s.size())
        throw EndOfFile("end of string reached");
    size_t n = s.copy(data, len, pos);
    pos += n;
    return n;
}

void writePadding(size_t len, Sink & sink)
{
    if (len % 8) {
        char zero[8];
        memset(zero, 0, sizeof(zero));
        sink({zero, 8 - (len % 8)});
    }
}

void writeString(std::string_view data, Sink & sink)
{
    sink << data.size();
    sink(data);
    writePadding(data.size(), sink);
}

Sink & operator<<(Sink & sink, std::string_view s)
{
    writeString(s, sink);
    return sink;
}

Sink & operator<<(Sink & sink, const Error & ex)
{
    auto & info = ex.info();
    sink << "Error" << info.level << "Error" // error name, always "Error"
         << info.msg.str() << 0              // no position
         << info.traces.size();
    for (auto & trace : info.traces) {
        sink << 0; // no position
        sink << trace.hint.str();
    }
    return sink;
}

void readPadding(size_t len, Source & source)
{
    if (len % 8) {
        char zero[8];
        size_t n = 8 - (len % 8);
        source(zero, n);
        for (unsigned int i = 0; i < n; i++)
            if (zero[i])
                throw SerialisationError("non-zero padding");
    }
}

std::string readString(Source & source, size_t max)
{
    auto len = readNum<size_t>(source);
    if (len > max)
        throw SerialisationError("string is too long");
    std::string res(len, 0);
    source(res.data(), len);
    readPadding(len, source);
    return res;
}

ErrorInfo readErrorInfo(Source & source, size_t max)
{
    auto type = readString(source, max);
    if (type != "Error")
        throw SerialisationError("expected a serialised error, got '%s'", type);
    auto level = readInt(source);
    if (level > lvlVomit)
        throw SerialisationError("invalid verbosity %d in serialised error", level);
    [[maybe_unused]] auto name = readString(source, max); // always "Error"
    auto msg = readString(source, max);
    ErrorInfo info{
        .level = (Verbosity) level,
        .msg = HintFmt(msg),
    };
    auto havePos = readNum<size_t>(source);
    if (havePos != 0)
        throw SerialisationError("serialised error carries an unsupported position");
    auto nrTraces = readNum<size_t>(source);
    for (size_t i = 0; i < nrTraces; ++i) {
        havePos = readNum<size_t>(source);
        if (havePos != 0)
            throw SerialisationError("serialised error trace carries an unsupported position");
        info.traces.push_back(Trace{.hint = HintFmt(readString(source, max))});
    }
    return info;
}

} // namespace confcache
