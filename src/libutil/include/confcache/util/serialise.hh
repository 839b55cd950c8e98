#pragma once
///@file

#include <cstdint>
#include <limits>
#include <memory>
#include <typeinfo>
#include <type_traits>

#include "confcache/util/types.hh"
#include "confcache/util/error.hh"

namespace confcache {

/**
 * Abstract destination of binary data.
 */
struct Sink
{
    virtual ~Sink() {}

    virtual void operator()(std::string_view data) = 0;

    virtual bool good()
    {
        return true;
    }
};

/**
 * Abstract source of binary data.
 */
struct Source
{
    virtual ~Source() {}

    /**
     * Store exactly ‘len’ bytes in the buffer pointed to by ‘data’.
     * It blocks until all the requested data is available, or throws
     * an error if it is not going to be available.
     */
    void operator()(char * data, size_t len);

    /**
     * Store up to ‘len’ in the buffer pointed to by ‘data’, and
     * return the number of bytes stored.  It blocks until at least
     * one byte is available.
     */
    virtual size_t read(char * data, size_t len) = 0;

    virtual bool good()
    {
        return true;
    }
};

/**
 * A sink that writes data to a string.
 */
struct StringSink : Sink
{
    std::string s;

    StringSink() {}

    explicit StringSink(const size_t reservedSize)
    {
        s.reserve(reservedSize);
    };

    StringSink(std::string && s)
        : s(std::move(s)) {};

    void operator()(std::string_view data) override;
};

/**
 * A source that reads data from a string.
 */
struct StringSource : Source
{
    std::string_view s;
    size_t pos;

    // NOTE: Prevent unintentional dangling views when an implicit conversion
    // from std::string -> std::string_view occurs when the string is passed
    // by rvalue.
    StringSource(std::string &&) = delete;

    StringSource(std::string_view s)
        : s(s)
        , pos(0)
    {
    }

    StringSource(const std::string & str)
        : StringSource(std::string_view(str))
    {
    }

    size_t read(char * data, size_t len) override;

    /**
     * Whether every byte of the string has been consumed.
     */
    bool atEnd() const
    {
        return pos >= s.size();
    }
};

MakeError(SerialisationError, Error);
MakeError(EndOfFile, Error);

void writePadding(size_t len, Sink & sink);
void writeString(std::string_view s, Sink & sink);

/**
 * Write a single raw byte, without the 8-byte framing used for
 * integers. Used for tags and ordinals.
 */
inline void writeByte(uint8_t b, Sink & sink)
{
    char c = (char) b;
    sink({&c, 1});
}

template<typename T>
T readLittleEndian(unsigned char * p)
{
    T x = 0;
    for (size_t i = 0; i < sizeof(x); ++i, ++p) {
        x |= ((T) *p) << (i * 8);
    }
    return x;
}

inline Sink & operator<<(Sink & sink, uint64_t n)
{
    unsigned char buf[8];
    buf[0] = n & 0xff;
    buf[1] = (n >> 8) & 0xff;
    buf[2] = (n >> 16) & 0xff;
    buf[3] = (n >> 24) & 0xff;
    buf[4] = (n >> 32) & 0xff;
    buf[5] = (n >> 40) & 0xff;
    buf[6] = (n >> 48) & 0xff;
    buf[7] = (unsigned char) (n >> 56) & 0xff;
    sink({(char *) buf, sizeof(buf)});
    return sink;
}

Sink & operator<<(Sink & in, const Error & ex);
Sink & operator<<(Sink & sink, std::string_view s);

inline uint8_t readByte(Source & source)
{
    char c;
    source(&c, 1);
    return (uint8_t) c;
}

template<typename T>
T readNum(Source & source)
{
    unsigned char buf[8];
    source((char *) buf, sizeof(buf));

    auto n = readLittleEndian<uint64_t>(buf);

    if (n > (uint64_t) std::numeric_limits<T>::max())
        throw SerialisationError("serialised integer %d is too large for type '%s'", n, typeid(T).name());

    return (T) n;
}

inline unsigned int readInt(Source & source)
{
    return readNum<unsigned int>(source);
}

void readPadding(size_t len, Source & source);
std::string readString(Source & source, size_t max = std::numeric_limits<size_t>::max());

/**
 * Read back an error written by `operator<<(Sink &, const Error &)`.
 * The result is always a plain `Error`; recovering the original type
 * is up to the caller. Strings longer than `max` are rejected.
 */
ErrorInfo readErrorInfo(Source & source, size_t max = std::numeric_limits<size_t>::max());

} // namespace confcache
