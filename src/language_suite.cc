#include <algorithm>
#include <cstdlib>
#include <new>
#include <polyexec/concat_tostr.hh>
#include <polyexec/language_suite.hh>
#include <polyexec/string_transform.hh>
#include <stdexcept>
#include <unistd.h>
#include <utility>

using std::string;
using std::vector;

namespace {

bool program_is_in_path(const string& program) {
    if (program.find('/') != string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = getenv("PATH");
    std::string_view path = (path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
    while (not path.empty()) {
        auto dir = path.substr(0, path.find(':'));
        path.remove_prefix(std::min(dir.size() + 1, path.size()));
        if (dir.empty()) {
            dir = ".";
        }
        if (access(concat_tostr(dir, '/', program).c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace polyexec {

vector<string> expand_command(const vector<string>& command_template, const CommandPaths& paths) {
    vector<string> res;
    res.reserve(command_template.size());
    for (const auto& arg : command_template) {
        auto expanded = replace_all(arg, placeholder::SOURCE, paths.source);
        expanded = replace_all(expanded, placeholder::BINARY, paths.binary);
        expanded = replace_all(expanded, placeholder::RUN_NAME, paths.run_name);
        expanded = replace_all(expanded, placeholder::WORKSPACE, paths.workspace);
        res.emplace_back(std::move(expanded));
    }
    return res;
}

bool toolchain_is_available(const LanguagePipeline& pipeline) {
    auto is_available = [](const vector<string>& command) {
        // A program being a placeholder is produced by the compile stage
        return command.front().find('{') != string::npos or program_is_in_path(command.front());
    };
    if (pipeline.compile_command and not is_available(*pipeline.compile_command)) {
        return false;
    }
    return is_available(pipeline.run_command);
}

LanguageRegistry::LanguageRegistry(vector<LanguagePipeline> pipelines)
: pipelines_{std::move(pipelines)} {
    auto add_key = [&](const string& key, size_t idx) {
        auto lower_key = to_lower(key);
        if (not index_.emplace(lower_key, idx).second) {
            throw std::invalid_argument(concat_tostr("language id registered twice: ", lower_key));
        }
    };

    for (size_t i = 0; i < pipelines_.size(); ++i) {
        const auto& pipeline = pipelines_[i];
        if (pipeline.name.empty()) {
            throw std::invalid_argument("language pipeline without a name");
        }
        if (pipeline.file_extension.empty()) {
            throw std::invalid_argument(
                concat_tostr("language pipeline ", pipeline.name, " has no file extension")
            );
        }
        if (pipeline.run_command.empty()) {
            throw std::invalid_argument(
                concat_tostr("language pipeline ", pipeline.name, " has an empty run command")
            );
        }
        if (pipeline.compile_command and pipeline.compile_command->empty()) {
            throw std::invalid_argument(
                concat_tostr("language pipeline ", pipeline.name, " has an empty compile command")
            );
        }

        add_key(pipeline.name, i);
        for (const auto& alias : pipeline.aliases) {
            add_key(alias, i);
        }
    }
}

const LanguageRegistry& LanguageRegistry::builtin() {
    static const LanguageRegistry registry{vector<LanguagePipeline>{
        {
            .name = "python",
            .aliases = {"py", "python3"},
            .file_extension = ".py",
            .run_command = {"python3", "{source}"},
        },
        {
            .name = "javascript",
            .aliases = {"js", "node", "nodejs"},
            .file_extension = ".js",
            .run_command = {"node", "{source}"},
        },
        {
            .name = "java",
            .file_extension = ".java",
            .source_stem = "Main",
            .compile_command = vector<string>{"javac", "-d", "{workspace}", "{source}"},
            .run_command = {"java", "-cp", "{workspace}", "{run_name}"},
        },
        {
            .name = "cpp",
            .aliases = {"c++", "cxx"},
            .file_extension = ".cpp",
            .compile_command = vector<string>{"g++", "-std=c++17", "-o", "{binary}", "{source}"},
            .run_command = {"{binary}"},
            .produces_binary = true,
        },
        {
            .name = "c",
            .file_extension = ".c",
            .compile_command = vector<string>{"gcc", "-o", "{binary}", "{source}"},
            .run_command = {"{binary}"},
            .produces_binary = true,
        },
    }};
    return registry;
}

const LanguagePipeline* LanguageRegistry::resolve(std::string_view language_id) const noexcept {
    try {
        auto it = index_.find(to_lower(trim(language_id)));
        return (it == index_.end() ? nullptr : &pipelines_[it->second]);
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

} // namespace polyexec
