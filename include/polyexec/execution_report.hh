#pragma once

#include <cstddef>
#include <polyexec/executor.hh>
#include <string>

namespace polyexec {

// Code longer than this is truncated in audit records
constexpr size_t AUDIT_CODE_MAX_LEN = 500;

// Translates @p outcome into the user-facing success flag
constexpr bool is_success(Outcome outcome) noexcept { return outcome == Outcome::SUCCESS; }

/**
 * @brief Serializes @p res into the boundary JSON object
 * @details Fields: stdout, stderr (null if empty), outcome, stage, exitCode
 *   (null if the process did not exit on its own or did not run) and
 *   elapsedMillis. Bytes of stdout and stderr that are not valid UTF-8 are
 *   written as "\xHH" (see escape_bytes_to_utf8_str()).
 */
std::string to_json(const ExecutionResult& res);

// Audit record of one execution: language, code truncated to
// AUDIT_CODE_MAX_LEN bytes without splitting a character, outcome, success
// and elapsedMillis
std::string audit_record_json(const ExecutionRequest& req, const ExecutionResult& res);

} // namespace polyexec
