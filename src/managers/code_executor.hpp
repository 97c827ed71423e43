#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <provider/sandbox_provider.hpp>
#include "session_store.hpp"

// Runs code in a session's sandbox and normalizes the provider output into
// an ExecutionResult. execute() never throws; every failure lands in error.
class CodeExecutor {
public:
    CodeExecutor(SessionStore& store, SandboxProvider& provider, int execution_timeout_ms);

    ExecutionResult execute(const std::string& session_id, const std::string& code);

    int execution_timeout_ms() const { return execution_timeout_ms_; }

private:
    SessionStore& store_;
    SandboxProvider& provider_;
    int execution_timeout_ms_;
};

// stdout lines then stderr lines, each joined with '\n', the two blocks
// separated by '\n' when both are non-empty. Result is trimmed.
std::string merge_output(const std::vector<std::string>& stdout_lines,
                         const std::vector<std::string>& stderr_lines);

// One image per artifact: png preferred, jpeg otherwise, none if neither.
std::vector<ExecutionImage> extract_images(const std::vector<SandboxArtifact>& artifacts);

// "name\nvalue\ntraceback" with empty parts left out.
std::string format_interpreter_error(const InterpreterError& err);
