#include <algorithm>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <polyexec/errmsg.hh>
#include <polyexec/file_contents.hh>
#include <polyexec/file_descriptor.hh>
#include <polyexec/macros/throw.hh>
#include <unistd.h>

size_t write_all(int fd, const void* buf, size_t count) noexcept {
    const auto* data = static_cast<const char*>(buf);
    size_t pos = 0;
    while (pos < count) {
        ssize_t rc = write(fd, data + pos, count - pos);
        if (rc > 0) {
            pos += rc;
        } else if (rc == -1 and errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    return pos;
}

std::string get_file_contents(int fd, off_t beg, size_t max_size) {
    if (lseek(fd, beg, SEEK_SET) == static_cast<off_t>(-1)) {
        THROW("lseek()", errmsg());
    }

    std::string res;
    std::array<char, 1 << 16> buff{};
    while (res.size() < max_size) {
        ssize_t rc = read(fd, buff.data(), std::min(buff.size(), max_size - res.size()));
        if (rc == 0) {
            break;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        res.append(buff.data(), rc);
    }
    return res;
}

std::string get_file_contents(const std::string& path) {
    FileDescriptor fd(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (not fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    return get_file_contents(fd, 0, static_cast<size_t>(-1));
}

void put_file_contents(const std::string& path, std::string_view data) {
    FileDescriptor fd(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (not fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    if (write_all(fd, data.data(), data.size()) != data.size()) {
        THROW("write('", path, "')", errmsg());
    }
    if (fd.close()) {
        THROW("close('", path, "')", errmsg());
    }
}
