#include "confcache/util/error.hh"
#include "confcache/util/logging.hh"
#include "confcache/util/strings.hh"

#include <iostream>
#include <sstream>

namespace confcache {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

// c++ std::exception descendants must have a 'const char* what()' function.
// This stringifies the error and caches it for use by what(), or similarly by msg().
const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
        return *what_;
    }
}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

static std::string indent(std::string_view indentFirst, std::string_view indentRest, std::string_view s)
{
    std::string res;
    bool first = true;

    while (!s.empty()) {
        auto end = s.find('\n');
        if (!first)
            res += "\n";
        res += chomp(std::string(first ? indentFirst : indentRest) + std::string(s.substr(0, end)));
        first = false;
        if (end == s.npos)
            break;
        s = s.substr(end + 1);
    }

    return res;
}

/**
 * Length of `s` as printed on a terminal, i.e. without the ANSI
 * colour escapes.
 */
static size_t visibleWidth(std::string_view s)
{
    size_t width = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\e') {
            while (i < s.size() && s[i] != 'm')
                ++i;
            continue;
        }
        width++;
    }
    return width;
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix;
    switch (einfo.level) {
    case Verbosity::lvlError: {
        prefix = ANSI_RED "error";
        break;
    }
    case Verbosity::lvlNotice: {
        prefix = ANSI_RED "note";
        break;
    }
    case Verbosity::lvlWarn: {
        prefix = ANSI_WARNING "warning";
        break;
    }
    case Verbosity::lvlInfo: {
        prefix = ANSI_GREEN "info";
        break;
    }
    case Verbosity::lvlTalkative: {
        prefix = ANSI_GREEN "talk";
        break;
    }
    case Verbosity::lvlChatty: {
        prefix = ANSI_GREEN "chat";
        break;
    }
    case Verbosity::lvlVomit: {
        prefix = ANSI_GREEN "vomit";
        break;
    }
    case Verbosity::lvlDebug: {
        prefix = ANSI_WARNING "debug";
        break;
    }
    }

    prefix += ":" ANSI_NORMAL " ";

    std::ostringstream oss;

    /* Only the innermost few traces are printed unless `show-trace`
       is set. */
    if (!einfo.traces.empty()) {
        size_t count = 0;
        bool truncate = false;

        for (const auto & trace : einfo.traces) {
            if (trace.hint.str().empty())
                continue;
            if (!showTrace && count >= 3) {
                truncate = true;
                break;
            }
            oss << "\n" << "… " << trace.hint.str() << "\n";
            count++;
        }

        if (truncate)
            oss << "\n" << ANSI_WARNING "(trace truncated; set 'show-trace' to show the full trace)" ANSI_NORMAL << "\n";

        oss << "\n" << prefix;
    }

    oss << einfo.msg << "\n";

    out << indent(prefix, std::string(visibleWidth(prefix), ' '), chomp(oss.str()));

    return out;
}

} // namespace confcache
