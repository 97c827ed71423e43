#include "frame_protocol.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

std::string build_run_frame(const std::string& code) {
    return std::string(FRAME_RUN) + " " + base64_encode(code) + "\n";
}

// "-" marks an empty field in EXC frames
static std::string decode_field(const std::string& token) {
    if (token == "-") return "";
    return base64_decode(token);
}

static std::string token_at(const std::vector<std::string>& tokens, size_t i) {
    return i < tokens.size() ? tokens[i] : "";
}

Frame parse_frame_line(const std::string& line) {
    Frame frame;
    auto tokens = split_ws(line);
    if (tokens.empty()) return frame;

    const std::string& marker = tokens[0];
    if (marker == FRAME_READY) {
        frame.type = FrameType::READY;
        frame.fields.push_back(token_at(tokens, 1));
    } else if (marker == FRAME_OUT || marker == FRAME_ERR) {
        frame.type = (marker == FRAME_OUT) ? FrameType::OUT : FrameType::ERR;
        frame.fields.push_back(base64_decode(token_at(tokens, 1)));
    } else if (marker == FRAME_ART) {
        frame.type = FrameType::ART;
        std::string png, jpeg;
        for (size_t i = 1; i < tokens.size(); i++) {
            const std::string& t = tokens[i];
            if (t.rfind("png=", 0) == 0) {
                png = t.substr(4);
            } else if (t.rfind("jpeg=", 0) == 0) {
                jpeg = t.substr(5);
            }
        }
        frame.fields = {png, jpeg};
    } else if (marker == FRAME_EXC) {
        frame.type = FrameType::EXC;
        for (size_t i = 1; i <= 3; i++) {
            frame.fields.push_back(decode_field(token_at(tokens, i)));
        }
    } else if (marker == FRAME_DONE) {
        frame.type = FrameType::DONE;
    }
    return frame;
}

// ── FrameCollector ──────────────────────────────────────────

FrameCollector::FrameCollector(OutputCallback on_output)
    : on_output_(std::move(on_output)) {}

bool FrameCollector::feed(const std::string& line) {
    if (done_) return true;

    Frame frame = parse_frame_line(line);
    switch (frame.type) {
        case FrameType::OUT:
            output_.stdout_lines.push_back(frame.fields[0]);
            if (on_output_) on_output_(OutputStream::STDOUT, frame.fields[0]);
            break;
        case FrameType::ERR:
            output_.stderr_lines.push_back(frame.fields[0]);
            if (on_output_) on_output_(OutputStream::STDERR, frame.fields[0]);
            break;
        case FrameType::ART:
            output_.artifacts.push_back({frame.fields[0], frame.fields[1]});
            break;
        case FrameType::EXC:
            output_.error = InterpreterError{frame.fields[0], frame.fields[1], frame.fields[2]};
            break;
        case FrameType::DONE:
            done_ = true;
            break;
        case FrameType::READY:
        case FrameType::NONE:
            break;
    }
    return done_;
}
