#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <linux/limits.h>
#include <polyexec/file_manip.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

int mkdir_r(string path, mode_t mode) noexcept {
    if (path.size() >= PATH_MAX) {
        errno = ENAMETOOLONG;
        return -1;
    }

    // Add ending slash (if not exists)
    if (path.empty() or path.back() != '/') {
        path += '/';
    }

    size_t end = 1; // If there is a leading slash, it will be omitted
    while (end < path.size()) {
        while (path[end] != '/') {
            ++end;
        }

        path[end] = '\0'; // Separate subpath
        if (mkdir(path.data(), mode) == -1 and errno != EEXIST) {
            return -1;
        }

        path[end++] = '/';
    }

    return 0;
}

// Removes everything inside the directory opened as @p fd, takes ownership of @p fd
static int remove_dir_contents_fd(int fd) noexcept {
    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        int ec = errno;
        (void)close(fd);
        errno = ec;
        return -1;
    }

    int rc = 0;
    int ec = 0;
    errno = 0;
    while (dirent* file = readdir(dir)) {
        if (file->d_name[0] == '.' and
            (file->d_name[1] == '\0' or (file->d_name[1] == '.' and file->d_name[2] == '\0')))
        {
            continue;
        }

        bool maybe_dir = true;
#ifdef _DIRENT_HAVE_D_TYPE
        maybe_dir = (file->d_type == DT_DIR or file->d_type == DT_UNKNOWN);
#endif
        if (maybe_dir) {
            int sub_fd = openat(dirfd(dir), file->d_name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
            if (sub_fd != -1) {
                if (remove_dir_contents_fd(sub_fd) or unlinkat(dirfd(dir), file->d_name, AT_REMOVEDIR)) {
                    rc = -1;
                    ec = errno;
                }
                errno = 0;
                continue;
            }
            // Not a directory (or a symlink) - unlink it
        }

        if (unlinkat(dirfd(dir), file->d_name, 0)) {
            rc = -1;
            ec = errno;
        }
        errno = 0;
    }
    if (errno != 0) {
        rc = -1;
        ec = errno;
    }

    (void)closedir(dir);
    errno = ec;
    return rc;
}

int remove_r(const string& path) noexcept {
    int fd = open(path.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlink(path.c_str());
    }
    if (remove_dir_contents_fd(fd)) {
        return -1;
    }
    return rmdir(path.c_str());
}
