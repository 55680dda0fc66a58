#include <cstdint>
#include <optional>
#include <polyexec/config_file.hh>
#include <polyexec/executor_config.hh>
#include <polyexec/file_contents.hh>
#include <polyexec/macros/throw.hh>
#include <string_view>
#include <utility>

namespace polyexec {

ExecutorConfig ExecutorConfig::load_from_file(const std::string& path) {
    return load_from_string(get_file_contents(path));
}

ExecutorConfig ExecutorConfig::load_from_string(std::string config) {
    ConfigFile cf;
    cf.add_vars(
        "scratch_dir",
        "time_limit_ms",
        "compile_time_limit_ms",
        "run_time_limit_ms",
        "max_output_size",
        "log_file",
        "error_log_file"
    );
    cf.load_config_from_string(std::move(config));

    auto positive_number = [&](std::string_view name) -> std::optional<uint64_t> {
        const auto& var = cf[name];
        if (not var.is_set()) {
            return std::nullopt;
        }
        auto val = var.as<uint64_t>();
        if (var.is_array() or not val or *val == 0) {
            THROW("config: ", name, " has to be a positive integer, got: ", var.as_string());
        }
        return val;
    };
    auto non_empty_string = [&](std::string_view name) -> std::optional<std::string> {
        const auto& var = cf[name];
        if (not var.is_set()) {
            return std::nullopt;
        }
        if (var.is_array() or var.as_string().empty()) {
            THROW("config: ", name, " has to be a non-empty string");
        }
        return var.as_string();
    };

    ExecutorConfig res;
    if (auto dir = non_empty_string("scratch_dir")) {
        res.scratch_dir = std::move(*dir);
    }
    if (auto ms = positive_number("time_limit_ms")) {
        res.compile_time_limit = res.run_time_limit = std::chrono::milliseconds{*ms};
    }
    if (auto ms = positive_number("compile_time_limit_ms")) {
        res.compile_time_limit = std::chrono::milliseconds{*ms};
    }
    if (auto ms = positive_number("run_time_limit_ms")) {
        res.run_time_limit = std::chrono::milliseconds{*ms};
    }
    if (auto size = positive_number("max_output_size")) {
        res.max_output_size = *size;
    }
    res.log_file = non_empty_string("log_file");
    res.error_log_file = non_empty_string("error_log_file");
    return res;
}

} // namespace polyexec
