#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyexec {

class WorkspaceError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// Per-request scratch directory and the files recorded in it
struct Workspace {
    std::string id;
    std::string root_dir; // absolute path with trailing '/', empty if released
    std::string source_path;
    std::optional<std::string> binary_path;
    std::optional<std::string> stdin_path;
    std::vector<std::string> artifacts; // other recorded files

    // Returns <root_dir><id><suffix>
    [[nodiscard]] std::string path_for(std::string_view suffix) const;
};

class WorkspaceManager {
    std::string base_dir_; // absolute path with trailing '/'

public:
    static constexpr size_t ID_LEN = 12;

    // Relative @p base_dir is resolved against the current working directory
    explicit WorkspaceManager(std::string base_dir);

    [[nodiscard]] const std::string& base_dir() const noexcept { return base_dir_; }

    /**
     * @brief Creates a fresh directory <base_dir>/<random id>/
     * @details The base directory is created if it does not exist.
     *
     * @errors Throws WorkspaceError if any directory cannot be created, in
     *   particular when the generated id already exists
     */
    [[nodiscard]] Workspace allocate() const;

    // Removes every file of @p ws and its root directory. Idempotent, errors
    // other than a missing file are logged and ignored.
    void release(Workspace& ws) const noexcept;
};

// Owns an allocated workspace and releases it upon destruction
class ScopedWorkspace {
    const WorkspaceManager* manager_;
    Workspace ws_;

public:
    explicit ScopedWorkspace(const WorkspaceManager& manager)
    : manager_{&manager}
    , ws_{manager.allocate()} {}

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    ScopedWorkspace(ScopedWorkspace&& other) noexcept
    : manager_{other.manager_}
    , ws_{std::move(other.ws_)} {
        other.ws_.root_dir.clear();
    }

    ScopedWorkspace& operator=(ScopedWorkspace&&) = delete;

    Workspace& operator*() noexcept { return ws_; }

    Workspace* operator->() noexcept { return &ws_; }

    ~ScopedWorkspace() { manager_->release(ws_); }
};

} // namespace polyexec
