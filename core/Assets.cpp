#include "core/Assets.hpp"
#include <filesystem>
#include <string>
#include <system_error>

namespace assets {

namespace fs = std::filesystem;

namespace {

fs::path FindAssetsDir() {
  std::error_code ec;
  fs::path current = fs::current_path(ec);
  if (ec) {
    return fs::path("assets");
  }

  // Look up to 3 levels up for the assets directory
  for (int i = 0; i < 4; ++i) {
    if (fs::is_directory(current / "assets", ec)) {
      return current / "assets";
    }
    if (!current.has_parent_path() || current.parent_path() == current) {
      break;
    }
    current = current.parent_path();
  }
  return fs::path("assets");
}

} // namespace

const char *Path(const char *relative) {
  static thread_local std::string s_PathBuf;
  s_PathBuf = (FindAssetsDir() / relative).string();
  return s_PathBuf.c_str();
}

bool Exists(const char *relative) {
  std::error_code ec;
  return fs::exists(FindAssetsDir() / relative, ec);
}

} // namespace assets
