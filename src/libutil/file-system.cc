#include "confcache/util/file-system.hh"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace confcache {

namespace {

/**
 * Closes the descriptor on scope exit.
 */
struct AutoCloseFD
{
    int fd;

    explicit AutoCloseFD(int fd)
        : fd(fd)
    {
    }

    AutoCloseFD(const AutoCloseFD &) = delete;

    ~AutoCloseFD()
    {
        if (fd != -1)
            ::close(fd);
    }

    void close(const std::string & path)
    {
        if (fd != -1) {
            int res = ::close(fd);
            fd = -1;
            if (res == -1)
                throw SysError("closing file '%1%'", path);
        }
    }
};

} // namespace

bool pathExists(const std::filesystem::path & path)
{
    struct stat st;
    if (::lstat(path.c_str(), &st) == 0)
        return true;
    if (errno != ENOENT && errno != ENOTDIR)
        throw SysError("getting status of '%1%'", path.string());
    return false;
}

std::string readFile(const std::filesystem::path & path)
{
    AutoCloseFD fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.fd == -1)
        throw SysError("opening file '%1%'", path.string());

    std::string res;
    char buf[64 * 1024];
    while (true) {
        auto n = ::read(fd.fd, buf, sizeof(buf));
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading from file '%1%'", path.string());
        }
        if (n == 0)
            break;
        res.append(buf, n);
    }
    return res;
}

void writeFile(const std::filesystem::path & path, std::string_view s)
{
    AutoCloseFD fd(::open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, 0666));
    if (fd.fd == -1)
        throw SysError("opening file '%1%'", path.string());

    while (!s.empty()) {
        auto n = ::write(fd.fd, s.data(), s.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file '%1%'", path.string());
        }
        s.remove_prefix(n);
    }

    /* Close explicitly to propagate the exceptions. */
    fd.close(path.string());
}

} // namespace confcache
