#include <array>
#include <cerrno>
#include <linux/limits.h>
#include <polyexec/concat_tostr.hh>
#include <polyexec/errmsg.hh>
#include <polyexec/file_manip.hh>
#include <polyexec/logger.hh>
#include <polyexec/macros/throw.hh>
#include <polyexec/random.hh>
#include <polyexec/workspace.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

namespace polyexec {

string Workspace::path_for(std::string_view suffix) const {
    return concat_tostr(root_dir, id, suffix);
}

WorkspaceManager::WorkspaceManager(string base_dir) : base_dir_{std::move(base_dir)} {
    if (base_dir_.empty()) {
        THROW_AS(WorkspaceError, "workspace base directory cannot be empty");
    }
    if (base_dir_.front() != '/') {
        std::array<char, PATH_MAX> cwd{};
        if (getcwd(cwd.data(), cwd.size()) == nullptr) {
            THROW_AS(WorkspaceError, "getcwd()", errmsg());
        }
        base_dir_ = concat_tostr(cwd.data(), '/', base_dir_);
    }
    if (base_dir_.back() != '/') {
        base_dir_ += '/';
    }
}

Workspace WorkspaceManager::allocate() const {
    if (mkdir_r(base_dir_) == -1) {
        THROW_AS(WorkspaceError, "mkdir_r('", base_dir_, "')", errmsg());
    }

    Workspace ws;
    ws.id = random_string(ID_LEN, "abcdefghijklmnopqrstuvwxyz0123456789");
    auto root_dir = concat_tostr(base_dir_, ws.id, '/');
    if (mkdir(root_dir.c_str(), S_IRWXU) == -1) {
        if (errno == EEXIST) {
            THROW_AS(WorkspaceError, "workspace id collision: ", ws.id);
        }
        THROW_AS(WorkspaceError, "mkdir('", root_dir, "')", errmsg());
    }
    ws.root_dir = std::move(root_dir);
    return ws;
}

void WorkspaceManager::release(Workspace& ws) const noexcept {
    if (ws.root_dir.empty()) {
        return; // Never allocated or already released
    }

    auto remove_file = [&](const string& path) {
        if (unlink(path.c_str()) == -1 and errno != ENOENT) {
            errlog("Workspace ", ws.id, ": unlink('", path, "')", errmsg());
        }
    };

    try {
        if (not ws.source_path.empty()) {
            remove_file(ws.source_path);
        }
        if (ws.binary_path) {
            remove_file(*ws.binary_path);
        }
        if (ws.stdin_path) {
            remove_file(*ws.stdin_path);
        }
        for (const auto& path : ws.artifacts) {
            remove_file(path);
        }
        // Compiler artifacts and whatever the program created
        if (remove_r(ws.root_dir) == -1 and errno != ENOENT) {
            errlog("Workspace ", ws.id, ": remove_r()", errmsg());
        }
    } catch (const std::exception& e) {
        errlog("Workspace ", ws.id, ": release failed: ", e.what());
    }

    ws.root_dir.clear();
}

} // namespace polyexec
