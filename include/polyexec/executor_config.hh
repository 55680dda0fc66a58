#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace polyexec {

struct ExecutorConfig {
    std::string scratch_dir = "/tmp/polyexec";
    std::chrono::nanoseconds compile_time_limit = std::chrono::seconds{10};
    std::chrono::nanoseconds run_time_limit = std::chrono::seconds{10};
    size_t max_output_size = 1 << 20; // per captured stream
    std::optional<std::string> log_file; // stderr if unset
    std::optional<std::string> error_log_file; // stderr if unset

    /**
     * @brief Loads configuration from file @p path, missing variables keep their
     *   default values
     * @details Recognized variables: scratch_dir, time_limit_ms (both stages),
     *   compile_time_limit_ms, run_time_limit_ms, max_output_size, log_file,
     *   error_log_file.
     *
     * @errors Throws ConfigFile::ParseError on syntax errors and
     *   std::runtime_error on invalid values
     */
    static ExecutorConfig load_from_file(const std::string& path);

    // Like load_from_file() but parses @p config contents directly
    static ExecutorConfig load_from_string(std::string config);
};

} // namespace polyexec
