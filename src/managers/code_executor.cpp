#include "code_executor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>
#include <exception>

std::string merge_output(const std::vector<std::string>& stdout_lines,
                         const std::vector<std::string>& stderr_lines) {
    std::string out = join(stdout_lines, "\n");
    std::string err = join(stderr_lines, "\n");
    if (!out.empty() && !err.empty()) out += "\n";
    out += err;
    trim(out);
    return out;
}

std::vector<ExecutionImage> extract_images(const std::vector<SandboxArtifact>& artifacts) {
    std::vector<ExecutionImage> images;
    for (const auto& a : artifacts) {
        if (!a.png.empty()) {
            images.push_back({ImageFormat::PNG, a.png});
        } else if (!a.jpeg.empty()) {
            images.push_back({ImageFormat::JPEG, a.jpeg});
        }
    }
    return images;
}

std::string format_interpreter_error(const InterpreterError& err) {
    std::vector<std::string> parts;
    if (!err.name.empty()) parts.push_back(err.name);
    if (!err.value.empty()) parts.push_back(err.value);
    if (!err.traceback.empty()) parts.push_back(err.traceback);
    return join(parts, "\n");
}

// ── CodeExecutor ────────────────────────────────────────────

CodeExecutor::CodeExecutor(SessionStore& store, SandboxProvider& provider,
                           int execution_timeout_ms)
    : store_(store), provider_(provider), execution_timeout_ms_(execution_timeout_ms) {}

static int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

ExecutionResult CodeExecutor::execute(const std::string& session_id, const std::string& code) {
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result;

    try {
        auto resolved = store_.resolve(session_id);
        if (resolved.is_err()) {
            result.error = resolved.error;
            result.execution_time_ms = elapsed_ms(start);
            sandcache_log(fmt::format("executor: session {}: {}", session_id, resolved.error));
            return result;
        }

        SessionLease& lease = resolved.value;
        result.sandbox_id = lease.sandbox_id();
        sandcache_log(fmt::format("executor: {} sandbox {} for session {} (run #{})",
                                  lease.created() ? "created" : "reusing",
                                  lease.sandbox_id(), session_id, lease.execution_count()));

        auto run = provider_.run_code(lease.sandbox(), code, execution_timeout_ms_,
            [](OutputStream stream, const std::string& line) {
                sandcache_log(fmt::format("executor: [{}] {}",
                    stream == OutputStream::STDOUT ? "stdout" : "stderr", line));
            });

        if (run.is_err()) {
            // Transport-level failure: the remote interpreter state is unknown.
            lease.mark_broken();
            result.error = run.error;
            result.execution_time_ms = elapsed_ms(start);
            sandcache_log(fmt::format("executor: sandbox {} failed: {}",
                                      lease.sandbox_id(), run.error));
            return result;
        }

        result.stdout_text = merge_output(run.value.stdout_lines, run.value.stderr_lines);
        result.images = extract_images(run.value.artifacts);
        if (run.value.error) {
            result.error = format_interpreter_error(*run.value.error);
        }
    } catch (const std::exception& e) {
        result.stdout_text.clear();
        result.images.clear();
        result.error = e.what();
        sandcache_log(fmt::format("executor: session {}: unexpected error: {}",
                                  session_id, e.what()));
    }

    result.execution_time_ms = elapsed_ms(start);
    sandcache_log(fmt::format("executor: session {} completed in {}ms. Images: {}, Error: {}",
                              session_id, result.execution_time_ms, result.images.size(),
                              result.failed() ? "yes" : "no"));
    return result;
}
