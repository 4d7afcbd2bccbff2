#include "csv_reflow/path_utils.hpp"
#include "csv_reflow/utf8.hpp"
#include <string>

namespace cr {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) && !ec;
}

FileFormat detect_format(std::string_view path) {
  const auto ext = std::filesystem::path(std::string(path)).extension().string();
  if (iequals(ext, ".csv")) return FileFormat::CSV;
  return FileFormat::Unknown;
}

}
