#include <algorithm>
#include <chrono>
#include <cstddef>
#include <fcntl.h>
#include <optional>
#include <polyexec/concat_tostr.hh>
#include <polyexec/debug_logger.hh>
#include <polyexec/errmsg.hh>
#include <polyexec/executor.hh>
#include <polyexec/file_contents.hh>
#include <polyexec/file_descriptor.hh>
#include <polyexec/logger.hh>
#include <polyexec/macros/throw.hh>
#include <polyexec/spawner.hh>
#include <utility>
#include <vector>

using std::string;
using std::vector;
using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;

namespace {

constexpr DebugLogger<false> debuglog;

// Reported instead of the real reason, which may contain host paths
constexpr const char* INTERNAL_ERROR_MESSAGE = "Internal error";

// Compilers write binaries and class files far larger than the captured output
constexpr size_t COMPILE_MAX_FILE_SIZE = 256 << 20;

} // namespace

namespace polyexec {

const char* to_str(Stage stage) noexcept {
    switch (stage) {
    case Stage::COMPILE: return "compile";
    case Stage::RUN: return "run";
    }
    __builtin_unreachable();
}

const char* to_str(Outcome outcome) noexcept {
    switch (outcome) {
    case Outcome::SUCCESS: return "success";
    case Outcome::COMPILE_ERROR: return "compileError";
    case Outcome::RUNTIME_ERROR: return "runtimeError";
    case Outcome::TIMEOUT: return "timeout";
    case Outcome::UNSUPPORTED_LANGUAGE: return "unsupportedLanguage";
    case Outcome::INTERNAL_ERROR: return "internalError";
    }
    __builtin_unreachable();
}

Executor::Executor(ExecutorConfig config, const LanguageRegistry& registry)
: config_{std::move(config)}
, registry_{registry}
, workspaces_{config_.scratch_dir} {}

ExecutionResult Executor::execute(const ExecutionRequest& request) const {
    const auto* pipeline = registry_.resolve(request.language);
    if (pipeline == nullptr) {
        stdlog("Rejected execution: unsupported language '", request.language, '\'');
        return {
            .stderr_str = concat_tostr("Unsupported language: ", request.language),
            .stage = Stage::COMPILE,
            .outcome = Outcome::UNSUPPORTED_LANGUAGE,
        };
    }

    auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return duration_cast<milliseconds>(std::chrono::steady_clock::now() - start_time);
    };

    std::optional<ScopedWorkspace> ws;
    try {
        ws.emplace(workspaces_);
    } catch (const WorkspaceError& e) {
        errlog("Cannot allocate workspace: ", e.what());
        return {
            .stderr_str = INTERNAL_ERROR_MESSAGE,
            .stage = Stage::COMPILE,
            .outcome = Outcome::INTERNAL_ERROR,
            .elapsed = elapsed(),
        };
    }

    try {
        auto res = execute_in(**ws, *pipeline, request);
        res.elapsed = elapsed();
        stdlog(
            "Workspace ",
            (*ws)->id,
            ": ",
            pipeline->name,
            " finished with ",
            to_str(res.outcome),
            " in the ",
            to_str(res.stage),
            " stage after ",
            res.elapsed.count(),
            " ms"
        );
        return res;
    } catch (const std::exception& e) {
        errlog("Workspace ", (*ws)->id, ": execution failed: ", e.what());
        throw;
    }
}

ExecutionResult Executor::execute_in(
    Workspace& ws, const LanguagePipeline& pipeline, const ExecutionRequest& request
) const {
    auto source_stem = pipeline.source_stem.value_or(ws.id);
    ws.source_path = concat_tostr(ws.root_dir, source_stem, pipeline.file_extension);
    put_file_contents(ws.source_path, request.code);
    if (pipeline.produces_binary) {
        ws.binary_path = ws.path_for("_out");
    }

    const CommandPaths paths = {
        .source = ws.source_path,
        .binary = ws.binary_path.value_or(""),
        .run_name = source_stem,
        .workspace = ws.root_dir,
    };

    // std::nullopt means that the process could not be started
    auto spawn = [&](Stage stage,
                     const vector<string>& command_template,
                     nanoseconds time_limit,
                     std::optional<int> stdin_fd,
                     std::optional<size_t> max_file_size
                 ) -> std::optional<Result<ProcessOutput, TimedOut>> {
        auto argv = expand_command(command_template, paths);
        debuglog("Workspace ", ws.id, ": starting the ", to_str(stage), " stage: ", argv.front());
        try {
            return Spawner::run(
                argv,
                {
                    .working_dir = ws.root_dir,
                    .time_limit = time_limit,
                    .stdin_fd = stdin_fd,
                    .max_output_size = config_.max_output_size,
                    .max_file_size = max_file_size,
                }
            );
        } catch (const SpawnError& e) {
            errlog("Workspace ", ws.id, ": cannot start the ", to_str(stage), " stage: ", e.what());
            return std::nullopt;
        }
    };

    auto internal_error = [](Stage stage) {
        return ExecutionResult{
            .stderr_str = INTERNAL_ERROR_MESSAGE,
            .stage = stage,
            .outcome = Outcome::INTERNAL_ERROR,
        };
    };
    auto time_limit_exceeded = [](Stage stage, nanoseconds time_limit) {
        return ExecutionResult{
            .stderr_str = concat_tostr(
                "Time limit exceeded (", duration_cast<milliseconds>(time_limit).count(), " ms)"
            ),
            .stage = stage,
            .outcome = Outcome::TIMEOUT,
        };
    };

    if (pipeline.compile_command) {
        auto cres = spawn(
            Stage::COMPILE,
            *pipeline.compile_command,
            config_.compile_time_limit,
            std::nullopt,
            std::max(COMPILE_MAX_FILE_SIZE, config_.max_output_size + 1)
        );
        if (not cres) {
            return internal_error(Stage::COMPILE);
        }
        if (cres->is_err()) {
            return time_limit_exceeded(Stage::COMPILE, config_.compile_time_limit);
        }
        auto output = std::move(*cres).unwrap();
        if (not output.exited_successfully()) {
            return {
                .stdout_str = std::move(output.stdout_str),
                .stderr_str = std::move(output.stderr_str),
                .stage = Stage::COMPILE,
                .outcome = Outcome::COMPILE_ERROR,
                .exit_code = output.exit_code,
            };
        }
    }

    FileDescriptor stdin_file;
    std::optional<int> stdin_fd;
    if (request.stdin_data) {
        ws.stdin_path = ws.path_for("_input.txt");
        put_file_contents(*ws.stdin_path, *request.stdin_data);
        stdin_file = FileDescriptor{ws.stdin_path->c_str(), O_RDONLY | O_CLOEXEC};
        if (not stdin_file.is_open()) {
            THROW("open('", *ws.stdin_path, "')", errmsg());
        }
        int fd = stdin_file;
        stdin_fd = fd;
    }

    // The program's own files share the limit of its output
    auto rres =
        spawn(Stage::RUN, pipeline.run_command, config_.run_time_limit, stdin_fd, std::nullopt);
    if (not rres) {
        return internal_error(Stage::RUN);
    }
    if (rres->is_err()) {
        return time_limit_exceeded(Stage::RUN, config_.run_time_limit);
    }
    auto output = std::move(*rres).unwrap();
    return {
        .stdout_str = std::move(output.stdout_str),
        .stderr_str = std::move(output.stderr_str),
        .stage = Stage::RUN,
        .outcome = (output.exited_successfully() ? Outcome::SUCCESS : Outcome::RUNTIME_ERROR),
        .exit_code = output.exit_code,
    };
}

} // namespace polyexec
