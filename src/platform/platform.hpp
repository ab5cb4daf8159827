#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Read a whole file into memory. Returns false if it cannot be opened.
bool read_file(const std::filesystem::path& path, std::string& out);

} // namespace platform
