#pragma once
#include <filesystem>
#include <string_view>

namespace cr {

enum class FileFormat { CSV, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv, any case).
FileFormat detect_format(std::string_view path);

}
