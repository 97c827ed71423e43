#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "../base_cli.hpp"

// Replace characters that are unsafe in file names with '_'.
std::string sanitize_for_filename(const std::string& s);

// Decode each image and write it to <dir>/<session>-<n>.<ext>, numbering
// from the CLI's per-session counter. Returns the written paths.
std::vector<std::filesystem::path> save_images(BaseCLI& cli, const std::string& session_id,
                                               const std::vector<ExecutionImage>& images);

// Render stdout, saved images, error and timing for one execution.
void print_execution_result(BaseCLI& cli, const std::string& session_id,
                            const ExecutionResult& result);

// Execute code in the current session and print the result.
void run_and_print(BaseCLI& cli, const std::string& code);
