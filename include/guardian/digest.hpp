#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace guardian {

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(std::string_view data);

// Lowercase hex SHA-256 of a file's contents. Throws std::runtime_error when unreadable.
std::string sha256_file_hex(const std::filesystem::path& path);

} // namespace guardian
