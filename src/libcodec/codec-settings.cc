#include "confcache/codec/codec-settings.hh"

namespace confcache {

CodecSettings codecSettings;

} // namespace confcache
