#pragma once

#include <string>
#include <vector>
#include <provider/sandbox_provider.hpp>

// Line-based framing between the host and the remote kernel.
// Used by SshSandboxProvider for every run and at kernel startup.

enum class FrameType { NONE, READY, OUT, ERR, ART, EXC, DONE };

struct Frame {
    FrameType type = FrameType::NONE;
    std::vector<std::string> fields;   // decoded payloads (ART keeps base64)
};

// "__SANDCACHE_RUN__ <base64 code>\n"
std::string build_run_frame(const std::string& code);

// Classify one line of kernel output. Lines without a leading marker are
// NONE and carry no fields.
//   READY -> {kernel_id}
//   OUT / ERR -> {line}
//   ART -> {png_b64, jpeg_b64}
//   EXC -> {name, value, traceback}
Frame parse_frame_line(const std::string& line);

// Accumulates the frames of one run into a RunOutput.
class FrameCollector {
public:
    explicit FrameCollector(OutputCallback on_output = nullptr);

    // Returns true once the DONE frame has been seen.
    bool feed(const std::string& line);

    bool done() const { return done_; }
    RunOutput take() { return std::move(output_); }

private:
    OutputCallback on_output_;
    RunOutput output_;
    bool done_ = false;
};
