#include <polyexec/escape_bytes_to_utf8_str.hh>
#include <polyexec/execution_report.hh>
#include <polyexec/json_str.hh>
#include <utility>

namespace polyexec {

std::string to_json(const ExecutionResult& res) {
    json_str::Object obj;
    obj.prop("stdout", escape_bytes_to_utf8_str(res.stdout_str));
    if (res.stderr_str.empty()) {
        obj.prop("stderr", nullptr);
    } else {
        obj.prop("stderr", escape_bytes_to_utf8_str(res.stderr_str));
    }
    obj.prop("outcome", to_str(res.outcome));
    obj.prop("stage", to_str(res.stage));
    obj.prop("exitCode", res.exit_code);
    obj.prop("elapsedMillis", res.elapsed.count());
    return std::move(obj).into_str();
}

std::string audit_record_json(const ExecutionRequest& req, const ExecutionResult& res) {
    auto code = escape_bytes_to_utf8_str(utf8_prefix(req.code, AUDIT_CODE_MAX_LEN));
    json_str::Object obj;
    obj.prop("language", escape_bytes_to_utf8_str(req.language))
        .prop("code", code)
        .prop("outcome", to_str(res.outcome))
        .prop("success", is_success(res.outcome))
        .prop("elapsedMillis", res.elapsed.count());
    return std::move(obj).into_str();
}

} // namespace polyexec
