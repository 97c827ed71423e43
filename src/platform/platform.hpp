#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Creates the directory (and parents) if missing. Returns false on failure.
bool ensure_dir(const std::filesystem::path& dir);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
