#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Creates a fresh, empty directory under the temp dir. Returns its path.
std::filesystem::path make_temp_dir(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
