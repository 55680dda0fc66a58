#include <algorithm>
#include <dirent.h>
#include <gtest/gtest.h>
#include <mutex>
#include <polyexec/file_contents.hh>
#include <polyexec/file_manip.hh>
#include <polyexec/temporary_directory.hh>
#include <polyexec/workspace.hh>
#include <set>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <utility>
#include <vector>

using polyexec::ScopedWorkspace;
using polyexec::Workspace;
using polyexec::WorkspaceError;
using polyexec::WorkspaceManager;
using std::string;
using std::vector;

namespace {

bool path_exists(const string& path) {
    struct stat64 st = {};
    return lstat64(path.c_str(), &st) == 0;
}

vector<string> dir_entries(const string& path) {
    vector<string> res;
    DIR* dir = opendir(path.c_str());
    if (dir == nullptr) {
        throw std::runtime_error("opendir() failed: " + path);
    }
    while (dirent* file = readdir(dir)) {
        string name = file->d_name;
        if (name != "." and name != "..") {
            res.emplace_back(std::move(name));
        }
    }
    (void)closedir(dir);
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(WorkspaceManager, base_dir_normalization) {
    EXPECT_EQ(WorkspaceManager{"/tmp/x"}.base_dir(), "/tmp/x/");
    EXPECT_EQ(WorkspaceManager{"/tmp/x/"}.base_dir(), "/tmp/x/");
    auto relative = WorkspaceManager{"rel/dir"}.base_dir();
    EXPECT_EQ(relative.front(), '/');
    EXPECT_TRUE(relative.ends_with("/rel/dir/")) << relative;
    EXPECT_THROW((void)WorkspaceManager{""}, WorkspaceError);
}

// NOLINTNEXTLINE
TEST(WorkspaceManager, allocate) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    // Missing base directory is created
    WorkspaceManager manager{tmp_dir.path() + "scratch/nested"};
    auto ws = manager.allocate();

    EXPECT_EQ(ws.id.size(), WorkspaceManager::ID_LEN);
    EXPECT_TRUE(std::all_of(ws.id.begin(), ws.id.end(), [](char c) {
        return (c >= 'a' and c <= 'z') or (c >= '0' and c <= '9');
    })) << ws.id;
    EXPECT_EQ(ws.root_dir, tmp_dir.path() + "scratch/nested/" + ws.id + "/");
    EXPECT_EQ(ws.path_for(".py"), ws.root_dir + ws.id + ".py");
    EXPECT_TRUE(ws.source_path.empty());
    EXPECT_FALSE(ws.binary_path);
    EXPECT_FALSE(ws.stdin_path);

    struct stat64 st = {};
    ASSERT_EQ(stat64(ws.root_dir.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(st.st_mode & 0777, S_IRWXU);

    manager.release(ws);
}

// NOLINTNEXTLINE
TEST(WorkspaceManager, release_removes_everything) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto ws = manager.allocate();
    ws.source_path = ws.path_for(".c");
    ws.binary_path = ws.path_for("_out");
    ws.stdin_path = ws.path_for("_input.txt");
    put_file_contents(ws.source_path, "int main() {}");
    put_file_contents(*ws.stdin_path, "input");
    // binary_path was never created
    ws.artifacts.emplace_back(ws.root_dir + "Main.class");
    put_file_contents(ws.artifacts.back(), "");
    ASSERT_EQ(mkdir_r(ws.root_dir + "program/created/dirs"), 0);
    auto root_dir = ws.root_dir;

    manager.release(ws);
    EXPECT_FALSE(path_exists(root_dir));
    EXPECT_TRUE(ws.root_dir.empty());
    EXPECT_TRUE(dir_entries(tmp_dir.path()).empty());

    // Idempotent
    manager.release(ws);
}

// NOLINTNEXTLINE
TEST(WorkspaceManager, allocation_failure) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    put_file_contents(tmp_dir.path() + "file", "");
    WorkspaceManager manager{tmp_dir.path() + "file/scratch"};
    EXPECT_THROW((void)manager.allocate(), WorkspaceError);
}

// NOLINTNEXTLINE
TEST(WorkspaceManager, concurrent_allocations_are_distinct) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path() + "scratch"};
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 50;

    std::mutex mtx;
    vector<Workspace> workspaces;
    vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i) {
                auto ws = manager.allocate();
                std::lock_guard lock{mtx};
                workspaces.emplace_back(std::move(ws));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<string> ids;
    for (const auto& ws : workspaces) {
        ids.emplace(ws.id);
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(dir_entries(manager.base_dir()).size(), ids.size());

    for (auto& ws : workspaces) {
        manager.release(ws);
    }
    EXPECT_TRUE(dir_entries(manager.base_dir()).empty());
}

// NOLINTNEXTLINE
TEST(ScopedWorkspace, released_at_scope_exit) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    string root_dir;
    {
        ScopedWorkspace ws{manager};
        root_dir = ws->root_dir;
        (*ws).source_path = ws->path_for(".py");
        put_file_contents(ws->source_path, "print(1)");
        EXPECT_TRUE(path_exists(root_dir));
    }
    EXPECT_FALSE(path_exists(root_dir));
}

// NOLINTNEXTLINE
TEST(ScopedWorkspace, released_during_stack_unwinding) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    string root_dir;
    try {
        ScopedWorkspace ws{manager};
        root_dir = ws->root_dir;
        throw std::runtime_error("disk full");
    } catch (const std::runtime_error&) {
    }
    ASSERT_FALSE(root_dir.empty());
    EXPECT_FALSE(path_exists(root_dir));
}

// NOLINTNEXTLINE
TEST(ScopedWorkspace, move) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    string root_dir;
    {
        ScopedWorkspace outer{manager};
        root_dir = outer->root_dir;
        {
            ScopedWorkspace inner{std::move(outer)};
            EXPECT_TRUE(path_exists(root_dir));
        }
        EXPECT_FALSE(path_exists(root_dir));
    }
    EXPECT_TRUE(dir_entries(tmp_dir.path()).empty());
}
