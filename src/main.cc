#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <polyexec/execution_report.hh>
#include <polyexec/executor.hh>
#include <polyexec/executor_config.hh>
#include <polyexec/file_contents.hh>
#include <polyexec/language_suite.hh>
#include <polyexec/logger.hh>
#include <polyexec/string_transform.hh>
#include <string>
#include <utility>

using std::optional;
using std::string;

namespace {

constexpr int EXIT_OUTCOME_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

struct CmdOptions {
    optional<string> config_file;
    optional<string> input_file;
    optional<std::chrono::milliseconds> time_limit;
    bool quiet = false;
    bool list_languages = false;
};

void help(const char* program_name) {
    if (program_name == nullptr) {
        program_name = "polyexec";
    }

    printf("Usage: %s [options] <language> <source file>\n", program_name);
    puts(R"==(Compiles (if needed) and runs the source file, then prints the result as JSON.

Options:
  -c FILE, --config FILE     Load configuration from FILE
  -h, --help                 Display this information
  -i FILE, --input FILE      Pass contents of FILE as the program's standard input
  -l, --languages            List supported languages and whether their toolchains are installed
  -q, --quiet                Do not log anything but errors
  -t MS, --time-limit MS     Set the time limit of both stages to MS milliseconds

Exit status: 0 if the program ran successfully, 1 on any other outcome,
2 on invalid usage or configuration.)==");
}

void list_languages() {
    for (const auto& pipeline : polyexec::LanguageRegistry::builtin().pipelines()) {
        string aliases;
        for (const auto& alias : pipeline.aliases) {
            back_insert(aliases, (aliases.empty() ? "" : ", "), alias);
        }
        printf(
            "%-12s %-22s %s\n",
            pipeline.name.c_str(),
            aliases.c_str(),
            (polyexec::toolchain_is_available(pipeline) ? "available" : "missing toolchain")
        );
    }
}

/**
 * Parses options passed via arguments
 * @param argc like in main (will be modified to hold the number of non-option
 *   parameters)
 * @param argv like in main (holds arguments)
 * @return parsed options or std::nullopt if the arguments are invalid
 */
optional<CmdOptions> parse_options(int& argc, char** argv) {
    CmdOptions opts;
    int new_argc = 1;

    auto option_argument = [&](int& i) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        (void)fprintf(stderr, "Option '%s' requires an argument\n", argv[i]);
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        if (argv[i][0] == '-' and argv[i][1] != '\0') {
            if (0 == strcmp(argv[i], "-c") or 0 == strcmp(argv[i], "--config")) {
                const char* arg = option_argument(i);
                if (arg == nullptr) {
                    return std::nullopt;
                }
                opts.config_file = arg;

            } else if (0 == strcmp(argv[i], "-h") or 0 == strcmp(argv[i], "--help")) {
                help(argv[0]);
                exit(0);

            } else if (0 == strcmp(argv[i], "-i") or 0 == strcmp(argv[i], "--input")) {
                const char* arg = option_argument(i);
                if (arg == nullptr) {
                    return std::nullopt;
                }
                opts.input_file = arg;

            } else if (0 == strcmp(argv[i], "-l") or 0 == strcmp(argv[i], "--languages")) {
                opts.list_languages = true;

            } else if (0 == strcmp(argv[i], "-q") or 0 == strcmp(argv[i], "--quiet")) {
                opts.quiet = true;

            } else if (0 == strcmp(argv[i], "-t") or 0 == strcmp(argv[i], "--time-limit")) {
                const char* arg = option_argument(i);
                if (arg == nullptr) {
                    return std::nullopt;
                }
                auto ms = str2num<uint64_t>(arg);
                if (not ms or *ms == 0) {
                    (void)fprintf(stderr, "Invalid time limit: '%s'\n", arg);
                    return std::nullopt;
                }
                opts.time_limit = std::chrono::milliseconds{*ms};

            } else { // Unknown
                (void)fprintf(stderr, "Unknown option: '%s'\n", argv[i]);
                return std::nullopt;
            }

        } else {
            argv[new_argc++] = argv[i];
        }
    }

    argc = new_argc;
    argv[argc] = nullptr;
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_options(argc, argv);
    if (not opts) {
        return EXIT_USAGE;
    }
    if (opts->list_languages) {
        list_languages();
        return 0;
    }
    if (argc != 3) {
        help(argv[0]);
        return EXIT_USAGE;
    }

    polyexec::ExecutorConfig config;
    try {
        if (opts->config_file) {
            config = polyexec::ExecutorConfig::load_from_file(*opts->config_file);
        }
        if (opts->time_limit) {
            config.compile_time_limit = config.run_time_limit = *opts->time_limit;
        }
        if (config.log_file) {
            stdlog.open(*config.log_file);
        }
        if (config.error_log_file) {
            errlog.open(*config.error_log_file);
        }
    } catch (const std::exception& e) {
        errlog("Invalid configuration: ", e.what());
        return EXIT_USAGE;
    }
    if (opts->quiet) {
        stdlog.use(nullptr);
    }

    polyexec::ExecutionRequest request;
    request.language = argv[1];
    try {
        request.code = get_file_contents(argv[2]);
        if (opts->input_file) {
            request.stdin_data = get_file_contents(*opts->input_file);
        }
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return EXIT_USAGE;
    }

    try {
        polyexec::Executor executor{std::move(config)};
        auto res = executor.execute(request);
        puts(polyexec::to_json(res).c_str());
        stdlog("Audit: ", polyexec::audit_record_json(request, res));
        return polyexec::is_success(res.outcome) ? 0 : EXIT_OUTCOME_FAILURE;
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return EXIT_OUTCOME_FAILURE;
    }
}
