#include "util/files.hpp"

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace {

struct Fd {
    int fd = -1;
    explicit Fd(const int f) : fd(f) {}
    ~Fd() { if (fd >= 0) ::close(fd); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
};

[[noreturn]] void throwErrno(const std::string& what, const std::filesystem::path& p) {
    throw std::system_error(errno, std::generic_category(), what + " " + p.string());
}

}

namespace es::util {

void writeFileAtomic(const std::filesystem::path& target, const std::string_view contents) {
    const auto dir = target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
    const auto tmp = dir / ("." + target.filename().string() + ".tmp");

    {
        const Fd out(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0640));
        if (out.fd < 0) throwErrno("open", tmp);

        const char* p = contents.data();
        size_t remaining = contents.size();
        while (remaining > 0) {
            const ssize_t w = ::write(out.fd, p, remaining);
            if (w < 0) {
                if (errno == EINTR) continue;
                throwErrno("write", tmp);
            }
            p += w;
            remaining -= static_cast<size_t>(w);
        }

        if (::fsync(out.fd) != 0) throwErrno("fsync", tmp);
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) throwErrno("rename", target);

    const Fd dirFd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dirFd.fd < 0) throwErrno("open", dir);
    if (::fsync(dirFd.fd) != 0) throwErrno("fsync", dir);
}

std::string readFile(const std::filesystem::path& path) {
    const Fd in(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) throwErrno("open", path);

    std::string out;
    char buf[8192];
    for (;;) {
        const ssize_t r = ::read(in.fd, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) continue;
            throwErrno("read", path);
        }
        if (r == 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

bool readExactAt(const std::filesystem::path& path, const uint64_t offset, const size_t len, std::string& out) {
    const Fd in(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) throwErrno("open", path);

    out.resize(len);
    size_t done = 0;
    while (done < len) {
        const ssize_t r = ::pread(in.fd, out.data() + done, len - done, static_cast<off_t>(offset + done));
        if (r < 0) {
            if (errno == EINTR) continue;
            throwErrno("pread", path);
        }
        if (r == 0) break;
        done += static_cast<size_t>(r);
    }
    out.resize(done);
    return done == len;
}

}
