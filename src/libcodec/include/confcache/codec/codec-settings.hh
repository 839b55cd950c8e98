#pragma once
///@file

#include "confcache/util/configuration.hh"

namespace confcache {

struct CodecSettings : public Config
{
    Setting<bool> reportBrokenValues{
        this,
        true,
        "report-broken-values",
        R"(
          Whether to record a problem when a provider fails to compute its
          value while it is being written. The failure itself is always
          stored and raised again when the value is read back and used.
        )"};

    Setting<unsigned int> maxProblems{
        this,
        512,
        "max-problems",
        R"(
          The number of problems an encode pass tolerates. Recording one
          more aborts the pass.
        )"};

    Setting<bool> failOnProblems{
        this,
        false,
        "fail-on-problems",
        R"(
          Whether finishing an encode pass that recorded problems is an
          error.
        )"};

    Setting<uint64_t> maxStringSize{
        this,
        64 * 1024 * 1024,
        "max-string-size",
        R"(
          The largest string, in bytes, accepted when reading a cache
          stream.
        )"};
};

extern CodecSettings codecSettings;

} // namespace confcache
