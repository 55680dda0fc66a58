#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

// Placeholders that may appear inside arguments of command templates
namespace placeholder {
constexpr std::string_view SOURCE = "{source}"; // absolute path of the source file
constexpr std::string_view BINARY = "{binary}"; // absolute path of the compiled binary
constexpr std::string_view RUN_NAME = "{run_name}"; // source file name without extension
constexpr std::string_view WORKSPACE = "{workspace}"; // workspace root directory
} // namespace placeholder

// Compile / run command templates of one language
struct LanguagePipeline {
    std::string name; // canonical language id, lowercase
    std::vector<std::string> aliases; // lowercase
    std::string file_extension; // with the leading dot, e.g. ".py"
    // If set, the source file is named <source_stem><file_extension> instead of
    // being named after the workspace id (e.g. Java wants the file named after
    // the public class)
    std::optional<std::string> source_stem;
    std::optional<std::vector<std::string>> compile_command; // absent for interpreted languages
    std::vector<std::string> run_command;
    bool produces_binary = false;
};

struct CommandPaths {
    std::string source;
    std::string binary;
    std::string run_name;
    std::string workspace;
};

// Substitutes placeholders in every argument of @p command_template
std::vector<std::string>
expand_command(const std::vector<std::string>& command_template, const CommandPaths& paths);

// Checks whether every program used by @p pipeline can be found in PATH
[[nodiscard]] bool toolchain_is_available(const LanguagePipeline& pipeline);

// Immutable table: language id or alias => pipeline. Safe for concurrent reads.
class LanguageRegistry {
    std::vector<LanguagePipeline> pipelines_;
    std::map<std::string, size_t, std::less<>> index_; // lowercase id or alias => pipelines_ index

public:
    /**
     * @errors Throws std::invalid_argument if a pipeline has an empty name,
     *   extension or run_command, or if an id or alias is registered twice
     */
    explicit LanguageRegistry(std::vector<LanguagePipeline> pipelines);

    LanguageRegistry(const LanguageRegistry&) = delete;
    LanguageRegistry(LanguageRegistry&&) noexcept = default;
    LanguageRegistry& operator=(const LanguageRegistry&) = delete;
    LanguageRegistry& operator=(LanguageRegistry&&) = delete;

    ~LanguageRegistry() = default;

    // Python, JavaScript, Java, C++ and C
    static const LanguageRegistry& builtin();

    // Case-insensitive lookup, returns nullptr if @p language_id is unknown
    [[nodiscard]] const LanguagePipeline* resolve(std::string_view language_id) const noexcept;

    [[nodiscard]] const std::vector<LanguagePipeline>& pipelines() const noexcept {
        return pipelines_;
    }
};

} // namespace polyexec
