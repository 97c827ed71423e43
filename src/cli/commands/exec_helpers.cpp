#include "exec_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>

namespace fs = std::filesystem;

std::string sanitize_for_filename(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        out += safe ? c : '_';
    }
    if (out.empty()) out = "session";
    return out;
}

std::vector<fs::path> save_images(BaseCLI& cli, const std::string& session_id,
                                  const std::vector<ExecutionImage>& images) {
    std::vector<fs::path> written;
    if (images.empty() || !cli.config) return written;

    fs::path dir = cli.config->output_dir();
    if (!platform::ensure_dir(dir)) {
        std::cout << theme::fail("Cannot create image directory " + dir.string());
        return written;
    }

    std::string stem = sanitize_for_filename(session_id);
    for (const auto& img : images) {
        int n = cli.next_image_index(session_id);
        fs::path path = dir / fmt::format("{}-{}.{}", stem, n, image_format_name(img.format));

        std::string bytes = base64_decode(img.base64);
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            std::cout << theme::fail("Cannot write " + path.string());
            continue;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        written.push_back(path);
        sandcache_log(fmt::format("cli: wrote {} ({} bytes)", path.string(), bytes.size()));
    }
    return written;
}

void print_execution_result(BaseCLI& cli, const std::string& session_id,
                            const ExecutionResult& result) {
    if (!result.stdout_text.empty()) {
        std::istringstream iss(result.stdout_text);
        std::string line;
        while (std::getline(iss, line)) {
            std::cout << "    " << line << "\n";
        }
    }

    for (const auto& path : save_images(cli, session_id, result.images)) {
        std::cout << theme::ok("Image " + path.string());
    }

    if (result.error) {
        std::istringstream iss(*result.error);
        std::string line;
        bool first = true;
        while (std::getline(iss, line)) {
            if (first) {
                std::cout << theme::fail(line);
                first = false;
            } else {
                std::cout << theme::red("      " + line) << "\n";
            }
        }
    }

    std::string footer = format_elapsed(result.execution_time_ms);
    if (!result.sandbox_id.empty()) footer += "  " + result.sandbox_id;
    std::cout << theme::dim("    " + footer) << "\n";
}

void run_and_print(BaseCLI& cli, const std::string& code) {
    if (!cli.require_pool()) return;

    std::string trimmed = code;
    trim(trimmed);
    if (trimmed.empty()) {
        std::cout << theme::fail("Nothing to run.");
        return;
    }

    auto result = cli.pool->execute(cli.current_session, code);
    print_execution_result(cli, cli.current_session, result);
}
