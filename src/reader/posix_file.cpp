#include "posix_file.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Mork {

static constexpr Size READ_CHUNK_SIZE {0x4000};

[[nodiscard]]
static auto to_status(int code, const std::string &path) -> Status
{
    const auto what = path + ": " + std::strerror(code);
    switch (code) {
        case ENOENT:
            return Status::not_found(what);
        case EINVAL:
            return Status::invalid_argument(what);
        default:
            return Status::system_error(what);
    }
}

[[nodiscard]]
static auto errno_to_status(const std::string &path) -> Status
{
    const auto code = errno;
    errno = 0;
    return to_status(code, path);
}

static auto file_read(int file, Byte *out, Size &size) -> int
{
    for (; ; ) {
        const auto n = read(file, out, size);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return -1;
        }
        size = static_cast<Size>(n);
        return 0;
    }
}

auto read_whole_file(const std::string &path, std::string &out) -> Status
{
    const auto fd = open(path.c_str(), O_RDONLY);
    if (fd < 0)
        return errno_to_status(path);

    auto s = Status::ok();
    struct stat st {};
    if (fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        s = Status::invalid_argument(path + ": is a directory");
    }

    out.clear();
    while (s.is_ok()) {
        const auto offset = out.size();
        out.resize(offset + READ_CHUNK_SIZE);

        auto size = READ_CHUNK_SIZE;
        if (file_read(fd, out.data() + offset, size)) {
            s = errno_to_status(path);
            size = 0;
        }
        out.resize(offset + size);
        if (size == 0)
            break;
    }

    if (close(fd) && s.is_ok())
        s = errno_to_status(path);
    return s;
}

} // namespace Mork
