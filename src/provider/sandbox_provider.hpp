#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <core/types.hpp>

// One renderable output of a run. Payloads are base64; either may be empty.
struct SandboxArtifact {
    std::string png;
    std::string jpeg;
};

// Interpreter-level exception raised by the executed code.
struct InterpreterError {
    std::string name;        // e.g. "ValueError"
    std::string value;       // e.g. "bad input"
    std::string traceback;
};

// Raw output of one run as reported by the provider.
struct RunOutput {
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    std::vector<SandboxArtifact> artifacts;
    std::optional<InterpreterError> error;
};

enum class OutputStream { STDOUT, STDERR };

// Called for each stdout/stderr line as the provider receives it.
using OutputCallback = std::function<void(OutputStream, const std::string&)>;

// Opaque reference to a remote sandbox. Owned by exactly one cache entry.
class SandboxHandle {
public:
    virtual ~SandboxHandle() = default;

    virtual const std::string& id() const = 0;

    // True once release_sandbox() has run for this handle.
    virtual bool released() const = 0;
};

// Remote execution service. Implementations must be safe to call from
// several threads for different handles at once.
class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    // Non-empty when the provider can never succeed as configured
    // (e.g. missing credential). Checked once at pool startup for a warning.
    virtual std::string configuration_error() const = 0;

    virtual Result<std::shared_ptr<SandboxHandle>> create_sandbox(int timeout_ms) = 0;

    // Err means transport failure or timeout; interpreter errors come back
    // inside RunOutput::error.
    virtual Result<RunOutput> run_code(SandboxHandle& handle, const std::string& code,
                                       int timeout_ms, OutputCallback on_output = nullptr) = 0;

    // Best effort. Releasing an already released handle is a no-op.
    virtual Result<void> release_sandbox(SandboxHandle& handle) = 0;
};
