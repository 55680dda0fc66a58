#pragma once

#include <chrono>
#include <optional>
#include <polyexec/executor_config.hh>
#include <polyexec/language_suite.hh>
#include <polyexec/workspace.hh>
#include <string>

namespace polyexec {

struct ExecutionRequest {
    std::string code;
    std::string language; // case-insensitive id or alias
    std::optional<std::string> stdin_data;
};

enum class Stage {
    COMPILE,
    RUN,
};

enum class Outcome {
    SUCCESS,
    COMPILE_ERROR,
    RUNTIME_ERROR,
    TIMEOUT,
    UNSUPPORTED_LANGUAGE,
    INTERNAL_ERROR,
};

const char* to_str(Stage stage) noexcept;

const char* to_str(Outcome outcome) noexcept;

struct ExecutionResult {
    std::string stdout_str;
    std::string stderr_str;
    Stage stage = Stage::COMPILE; // stage that produced the outcome
    Outcome outcome = Outcome::INTERNAL_ERROR;
    std::optional<int> exit_code;
    std::chrono::milliseconds elapsed{0};
};

// Compiles (if needed) and runs programs, one independent workspace per call
class Executor {
    ExecutorConfig config_;
    const LanguageRegistry& registry_;
    WorkspaceManager workspaces_;

public:
    explicit Executor(
        ExecutorConfig config, const LanguageRegistry& registry = LanguageRegistry::builtin()
    );

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

    [[nodiscard]] const WorkspaceManager& workspace_manager() const noexcept {
        return workspaces_;
    }

    /**
     * @brief Executes @p request and describes what happened
     * @details Thread-safe, concurrent calls share nothing but the registry and
     *   the scratch directory. Unsupported language, compilation errors, runtime
     *   errors, timeouts and failures to allocate a workspace or to spawn a
     *   process are reported in the result. The workspace is removed on every
     *   path out of this function.
     *
     * @errors Anything unexpected (e.g. failing to write the source file)
     *   propagates as an exception
     */
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request) const;

private:
    ExecutionResult execute_in(
        Workspace& ws, const LanguagePipeline& pipeline, const ExecutionRequest& request
    ) const;
};

} // namespace polyexec
