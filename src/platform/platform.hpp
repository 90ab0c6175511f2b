#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Search PATH for an executable file named `program`. A name containing a
// slash is checked as-is.
std::optional<std::filesystem::path> find_executable(const std::string& program);

} // namespace platform
