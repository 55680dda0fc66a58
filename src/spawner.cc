#include <array>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <polyexec/call_in_destructor.hh>
#include <polyexec/concat_tostr.hh>
#include <polyexec/errmsg.hh>
#include <polyexec/file_contents.hh>
#include <polyexec/file_descriptor.hh>
#include <polyexec/macros/throw.hh>
#include <polyexec/spawner.hh>
#include <sys/mman.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

using std::string;
using std::vector;
using std::chrono::nanoseconds;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr timespec to_timespec(nanoseconds dur) noexcept {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(dur);
    return {secs.count(), (dur - secs).count()};
}

constexpr nanoseconds to_nanoseconds(const timespec& ts) noexcept {
    return std::chrono::seconds{ts.tv_sec} + nanoseconds{ts.tv_nsec};
}

constexpr bool is_zero(const timespec& ts) noexcept { return ts.tv_sec == 0 and ts.tv_nsec == 0; }

pid_t current_tid() noexcept { return static_cast<pid_t>(syscall(SYS_gettid)); }

int waitid_no_eintr(idtype_t idtype, id_t id, siginfo_t* infop, int options) noexcept {
    int rc = 0;
    while ((rc = waitid(idtype, id, infop, options)) == -1 and errno == EINTR) {
    }
    return rc;
}

FileDescriptor create_memfd(const char* name) {
    FileDescriptor fd{memfd_create(name, MFD_CLOEXEC)};
    if (not fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    return fd;
}

} // namespace

namespace polyexec {

string Spawner::receive_error_message(int fd) {
    string message;
    std::array<char, 4096> buff{};
    ssize_t rc = 0;
    while ((rc = read(fd, buff.data(), buff.size())) != 0) {
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        message.append(buff.data(), rc);
    }
    return message;
}

timespec Spawner::Timer::delete_timer_and_get_remaining_time() noexcept {
    return std::visit(
        overloaded{
            [](const WithoutTimeout& /*unused*/) { return timespec{0, 0}; },
            [&](WithTimeout& state) {
                if (not state.timer_is_active) {
                    return timespec{0, 0};
                }
                state.timer_is_active = false;
                // Disarm timer and check if it has expired
                itimerspec new_its{{0, 0}, {0, 0}};
                itimerspec old_its{};
                int rc = timer_settime(state.timer_id, 0, &new_its, &old_its);
                assert(rc == 0);
                if (is_zero(old_its.it_value)) {
                    // Timer has expired => the signal is queued for this thread and
                    // will be handled on the next return from the kernel
                    while (not state.signal_handler_context.timeout_signal_was_sent) {
                        sched_yield();
                    }
                }

                rc = timer_delete(state.timer_id);
                assert(rc == 0);
                (void)rc;
                return old_its.it_value;
            }},
        state_
    );
}

Spawner::Timer::Timer(pid_t watched_pgid, nanoseconds time_limit, int timer_signal)
: creator_thread_id_(current_tid())
, state_([&]() -> decltype(state_) {
    if (time_limit == nanoseconds::zero()) {
        timespec curr_clock_time{};
        if (clock_gettime(CLOCK_MONOTONIC, &curr_clock_time)) {
            THROW("clock_gettime()", errmsg());
        }
        return WithoutTimeout{curr_clock_time};
    }

    return WithTimeout{to_timespec(time_limit), {}, false, {watched_pgid, false}};
}()) {
    if (std::holds_alternative<WithoutTimeout>(state_)) {
        return; // Nothing more to do
    }

    auto& state = std::get<WithTimeout>(state_);
    // It is OK to use static, since the class and constructor is not a template
    static constexpr auto timeout_handler = [](int /*unused*/,
                                               siginfo_t* si,
                                               void* /*unused*/) noexcept {
        if (si->si_code != SI_TIMER) {
            return; // Ignore other signals
        }

        int errnum = errno;
        auto& context = *static_cast<SignalHandlerContext*>(si->si_value.sival_ptr);
        (void)kill(-context.watched_pgid, SIGKILL); // signal safe
        context.timeout_signal_was_sent = true;
        errno = errnum;
    };

    // Install timeout signal handler
    struct sigaction sa = {};
    sa.sa_flags = SA_SIGINFO | SA_RESTART;
    sa.sa_sigaction = timeout_handler;
    if (sigaction(timer_signal, &sa, nullptr)) {
        THROW("sigaction()", errmsg());
    }

    // Prepare timer, the signal is delivered to the creating thread only
    sigevent sev{};
    memset(&sev, 0, sizeof(sev));
    sev.sigev_notify = SIGEV_THREAD_ID;
    sev._sigev_un._tid = creator_thread_id_; // sigev_notify_thread_id
    sev.sigev_signo = timer_signal;
    sev.sigev_value.sival_ptr = &state.signal_handler_context;
    if (timer_create(CLOCK_MONOTONIC, &sev, &state.timer_id)) {
        THROW("timer_create()", errmsg());
    }

    state.timer_is_active = true;

    // Arm timer
    itimerspec its{{0, 0}, state.time_limit};
    if (timer_settime(state.timer_id, 0, &its, nullptr)) {
        int errnum = errno;
        (void)delete_timer_and_get_remaining_time();
        THROW("timer_settime()", errmsg(errnum));
    }
}

nanoseconds Spawner::Timer::deactivate_and_get_runtime() noexcept {
    return std::visit(
        overloaded{
            [&](const WithoutTimeout& state) {
                timespec curr_clock_time{};
                int rc = clock_gettime(CLOCK_MONOTONIC, &curr_clock_time);
                assert(rc == 0);
                (void)rc;
                return to_nanoseconds(curr_clock_time) - to_nanoseconds(state.start_clock_time);
            },
            [&](WithTimeout& state) {
                assert(state.timer_is_active and "You can call this function only once");
                return to_nanoseconds(state.time_limit) -
                    to_nanoseconds(delete_timer_and_get_remaining_time());
            }},
        state_
    );
}

bool Spawner::Timer::timeout_signal_was_sent() const noexcept {
    assert(
        creator_thread_id_ == current_tid() and
        "This can only be used by the same thread that constructed this object"
    );
    return std::visit(
        overloaded{
            [](const WithoutTimeout& /*unused*/) { return false; },
            [](const WithTimeout& state) -> bool {
                return state.signal_handler_context.timeout_signal_was_sent;
            }},
        state_
    );
}

Result<ProcessOutput, TimedOut> Spawner::run(const vector<string>& argv, const Options& opts) {
    using std::chrono_literals::operator""ns;

    if (argv.empty()) {
        THROW_AS(SpawnError, "cannot run a process without arguments");
    }
    if (opts.time_limit < 0ns) {
        THROW("time_limit has to be non-negative");
    }

    // Prepared before fork() so that the child does not need to allocate
    vector<const char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.emplace_back(arg.c_str());
    }
    c_argv.emplace_back(nullptr);

    FileDescriptor dev_null;
    int stdin_fd = opts.stdin_fd.value_or(-1);
    if (not opts.stdin_fd) {
        dev_null = FileDescriptor{"/dev/null", O_RDONLY | O_CLOEXEC};
        if (not dev_null.is_open()) {
            THROW("open('/dev/null')", errmsg());
        }
        stdin_fd = dev_null;
    }
    auto stdout_fd = create_memfd("stdout");
    auto stderr_fd = create_memfd("stderr");

    // Error stream from child via pipe
    std::array<int, 2> pfd{};
    if (pipe2(pfd.data(), O_CLOEXEC) == -1) {
        THROW("pipe()", errmsg());
    }
    FileDescriptor error_pipe_read{pfd[0]};
    FileDescriptor error_pipe_write{pfd[1]};

    pid_t cpid = fork();
    if (cpid == -1) {
        THROW_AS(SpawnError, "fork()", errmsg());
    }
    if (cpid == 0) {
        run_child(c_argv, opts, stdin_fd, stdout_fd, stderr_fd, error_pipe_write);
    }

    (void)error_pipe_write.close();

    // Wait for child to be ready
    siginfo_t si{};
    if (waitid_no_eintr(P_PID, cpid, &si, WSTOPPED | WEXITED) == -1) {
        THROW("waitid()", errmsg());
    }

    // If something went wrong the child is already reaped
    if (si.si_code != CLD_STOPPED) {
        auto message = receive_error_message(error_pipe_read);
        if (message.empty()) {
            message = concat_tostr("process died before execvp() with si_code ", si.si_code);
        }
        THROW_AS(SpawnError, message);
    }

    // Kills what is left of the process group and reaps the child
    CallInDtor kill_and_wait_child_guard([&] {
        (void)kill(-cpid, SIGKILL);
        (void)waitid_no_eintr(P_PID, cpid, &si, WEXITED);
    });

    Timer timer(cpid, opts.time_limit);
    (void)kill(cpid, SIGCONT); // There is only one process now, so '-' is not needed

    // Wait for death of the child, but leave it as a zombie so that its pid (and
    // thereby the process group id) cannot be reused until we kill the group
    if (waitid_no_eintr(P_PID, cpid, &si, WEXITED | WNOWAIT) == -1) {
        THROW("waitid()", errmsg());
    }
    auto runtime = timer.deactivate_and_get_runtime();
    bool timed_out = timer.timeout_signal_was_sent();

    kill_and_wait_child_guard.call_and_cancel();

    auto error_message = receive_error_message(error_pipe_read);
    if (not error_message.empty()) {
        THROW_AS(SpawnError, error_message);
    }

    if (timed_out) {
        return Err{TimedOut{.runtime = runtime}};
    }

    return Ok{ProcessOutput{
        .stdout_str = get_file_contents(stdout_fd, 0, opts.max_output_size),
        .stderr_str = get_file_contents(stderr_fd, 0, opts.max_output_size),
        .exit_code = (si.si_code == CLD_EXITED ? si.si_status : 128 + si.si_status),
        .runtime = runtime,
    }};
}

void Spawner::run_child(
    const vector<const char*>& argv,
    const Options& opts,
    int stdin_fd,
    int stdout_fd,
    int stderr_fd,
    int error_fd
) noexcept {
    // Sends error to parent
    auto send_error_and_exit = [error_fd](int errnum, std::string_view what) {
        auto message = concat_tostr(what, errmsg(errnum));
        (void)write_all(error_fd, message.data(), message.size());
        _exit(127);
    };

    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        send_error_and_exit(errno, "setpgid()");
    }

    // Do not pass the parent thread's blocked signals to the program
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr)) {
        send_error_and_exit(errno, "sigprocmask()");
    }

    // Change stdin, stdout and stderr
    for (auto [old_fd, new_fd] : {
             std::pair{stdin_fd, STDIN_FILENO},
             std::pair{stdout_fd, STDOUT_FILENO},
             std::pair{stderr_fd, STDERR_FILENO},
         })
    {
        while (dup2(old_fd, new_fd) == -1) {
            if (errno != EINTR) {
                send_error_and_exit(errno, "dup2()");
            }
        }
    }

    // Close file descriptors that are not needed to be open (for security reasons)
    {
        DIR* dir = opendir("/proc/self/fd");
        if (dir == nullptr) {
            send_error_and_exit(errno, "opendir()");
        }
        while (dirent* file = readdir(dir)) {
            char* end = nullptr;
            long fd = strtol(file->d_name, &end, 10);
            if (end == file->d_name or *end != '\0') {
                continue; // . or ..
            }
            if (fd <= STDERR_FILENO or fd == error_fd or fd == dirfd(dir)) {
                continue;
            }
            (void)close(static_cast<int>(fd));
        }
        (void)closedir(dir);
    }

    // Change working directory
    if (not opts.working_dir.empty() and chdir(opts.working_dir.c_str()) == -1) {
        send_error_and_exit(errno, "chdir()");
    }

    // Limit below is useful when spawned process becomes orphaned
    if (opts.time_limit > nanoseconds::zero()) {
        using std::chrono_literals::operator""ms;
        rlimit limit{};
        limit.rlim_cur = limit.rlim_max =
            std::chrono::duration_cast<std::chrono::seconds>(opts.time_limit + 1500ms).count();
        if (setrlimit(RLIMIT_CPU, &limit)) {
            send_error_and_exit(errno, "setrlimit(RLIMIT_CPU)");
        }
    }

    // Bound the memory files holding stdout and stderr
    {
        rlimit limit{};
        limit.rlim_cur = limit.rlim_max = opts.max_file_size.value_or(opts.max_output_size + 1);
        if (setrlimit(RLIMIT_FSIZE, &limit)) {
            send_error_and_exit(errno, "setrlimit(RLIMIT_FSIZE)");
        }
    }
    // Writes past the limit fail with EFBIG instead of killing the process
    if (signal(SIGXFSZ, SIG_IGN) == SIG_ERR) {
        send_error_and_exit(errno, "signal(SIGXFSZ)");
    }

    // Signal parent process that child is ready to execute argv[0]
    (void)kill(getpid(), SIGSTOP);

    execvp(argv[0], const_cast<char* const*>(argv.data()));
    int errnum = errno;
    send_error_and_exit(errnum, concat_tostr("execvp('", argv[0], "')"));
    _exit(127); // unreachable, send_error_and_exit() does not return
}

} // namespace polyexec
