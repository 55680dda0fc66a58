#pragma once

#include <chrono>
#include <csignal>
#include <cstddef>
#include <ctime>
#include <optional>
#include <polyexec/result.hh>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <variant>
#include <vector>

namespace polyexec {

// Thrown when a process cannot be started at all
class SpawnError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

struct ProcessOutput {
    std::string stdout_str;
    std::string stderr_str;
    // Exit status, or 128 + signal number if the process was killed by a signal
    int exit_code = 0;
    std::chrono::nanoseconds runtime{0};

    [[nodiscard]] bool exited_successfully() const noexcept { return exit_code == 0; }
};

struct TimedOut {
    std::chrono::nanoseconds runtime{0};
};

class Spawner {
public:
    struct Options {
        std::string working_dir; // empty - do not change
        std::chrono::nanoseconds time_limit;
        std::optional<int> stdin_fd; // std::nullopt - /dev/null
        size_t max_output_size = 1 << 20; // per stream, the rest is discarded
        // RLIMIT_FSIZE of the process, applies to the captured streams and to
        // every file it writes; std::nullopt - max_output_size + 1
        std::optional<size_t> max_file_size;
    };

    /**
     * @brief Runs @p argv[0] (looked up in PATH) with arguments @p argv and
     *   waits until it exits or @p opts.time_limit of real time passes
     * @details Arguments are passed to execvp() as they are, no shell is involved.
     *   The process is started in a new process group. Once the time limit
     *   expires the whole group is killed with SIGKILL. After the main process
     *   exits, the rest of its process group is killed too and the process is
     *   reaped, so nothing left in the group survives this call.
     *   stdout and stderr are captured in memory files and read after the exit.
     *   The memory files cannot grow past @p opts.max_file_size: writes beyond
     *   it fail with EFBIG (SIGXFSZ is ignored in the child), so a program that
     *   keeps printing usually exits with an error.
     *   Only the process group is killed, a descendant that moves itself to
     *   another group or session (setsid(), setpgid()) is not killed and is
     *   limited only by RLIMIT_CPU (@p opts.time_limit + 1.5 s of CPU time).
     *   This function is thread-safe.
     *   IMPORTANT: To function properly this function uses internally signal
     *     SIGRTMIN and installs handler for it. So be aware that using this
     *     signal while this function runs (in any thread) is not safe.
     *
     * @return Ok{ProcessOutput} if the process exited (with any status) before
     *   the deadline, Err{TimedOut} otherwise (no output is returned then)
     *
     * @errors Throws SpawnError if the process could not be started (e.g.
     *   fork(), chdir() or execvp() failed) and std::runtime_error if any other
     *   syscall fails
     */
    static Result<ProcessOutput, TimedOut>
    run(const std::vector<std::string>& argv, const Options& opts);

private:
    /**
     * @brief Initializes child process which will execute @p argv, this
     *   function does not return
     * @details Errors are written to @p error_fd before _exit().
     */
    [[noreturn]] static void run_child(
        const std::vector<const char*>& argv,
        const Options& opts,
        int stdin_fd,
        int stdout_fd,
        int stderr_fd,
        int error_fd
    ) noexcept;

    // Reads what the child wrote to the error pipe, empty if exec succeeded
    static std::string receive_error_message(int fd);

    class Timer {
        struct SignalHandlerContext {
            const pid_t watched_pgid;
            volatile std::sig_atomic_t timeout_signal_was_sent;
        };

        struct WithTimeout {
            const timespec time_limit;
            timer_t timer_id;
            bool timer_is_active;
            SignalHandlerContext signal_handler_context;
        };

        struct WithoutTimeout {
            const timespec start_clock_time;
        };

        const pid_t creator_thread_id_;
        std::variant<WithTimeout, WithoutTimeout> state_;

        timespec delete_timer_and_get_remaining_time() noexcept;

    public:
        /**
         * @param watched_pgid process group to kill on timeout
         * @param time_limit if set to 0, then no timer is installed
         * @param timer_signal signal for which a timeout handler will be installed
         */
        Timer(pid_t watched_pgid, std::chrono::nanoseconds time_limit, int timer_signal = SIGRTMIN);

        Timer(const Timer&) = delete;
        Timer(Timer&&) = delete;
        Timer& operator=(const Timer&) = delete;
        Timer& operator=(Timer&&) = delete;

        std::chrono::nanoseconds deactivate_and_get_runtime() noexcept;

        [[nodiscard]] bool timeout_signal_was_sent() const noexcept;

        ~Timer() { (void)delete_timer_and_get_remaining_time(); }
    };
};

} // namespace polyexec
