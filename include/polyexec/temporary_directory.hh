#pragma once

#include <string>
#include <utility>

// Creates a directory with mkdtemp(3) and removes it recursively upon destruction
class TemporaryDirectory {
    std::string path_; // absolute path with trailing '/'

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to be an absolute path ending with "XXXXXX"
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept : path_{std::move(other.path_)} {
        other.path_.clear();
    }
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Directory absolute path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
