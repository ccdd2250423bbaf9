#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory; /tmp if it can't be determined.
std::filesystem::path temp_dir();

} // namespace platform
