#include "aed/model/model.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>

#include "aed/util/logging.hpp"

namespace aed::model {
using aed::util::ErrorCode;
using aed::util::Expected;
namespace fs = std::filesystem;

namespace {

// name → size in bytes. False on a malformed line.
bool parse_manifest(std::istream& in, std::map<std::string, std::uintmax_t>& out) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string name;
    std::uintmax_t size = 0;
    if (!(ls >> name >> size)) return false;
    std::string extra;
    if (ls >> extra) return false;
    out[name] = size;
  }
  return true;
}

} // namespace

Expected<void> validate_cache(const fs::path& dir, const CacheLayout& layout) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return tl::unexpected(ErrorCode::NotFound);

  std::ifstream mf(dir / layout.manifest_file);
  if (!mf) {
    AED_LOG_DEBUG("cache " << dir.string() << ": no manifest");
    return tl::unexpected(ErrorCode::CacheCorrupt);
  }

  std::map<std::string, std::uintmax_t> entries;
  if (!parse_manifest(mf, entries)) return tl::unexpected(ErrorCode::CacheCorrupt);
  if (!entries.count(layout.model_file) || !entries.count(layout.class_map_file))
    return tl::unexpected(ErrorCode::CacheCorrupt);

  for (const auto& [name, size] : entries) {
    const auto actual = fs::file_size(dir / name, ec);
    if (ec || actual != size) {
      AED_LOG_DEBUG("cache " << dir.string() << ": " << name << " missing or wrong size");
      return tl::unexpected(ErrorCode::CacheCorrupt);
    }
  }
  return {};
}

Expected<void> write_manifest(const fs::path& dir, const CacheLayout& layout) {
  std::error_code ec;
  std::ostringstream body;
  for (const auto* name : {&layout.model_file, &layout.class_map_file}) {
    const auto size = fs::file_size(dir / *name, ec);
    if (ec) return tl::unexpected(ErrorCode::NotFound);
    body << *name << ' ' << size << '\n';
  }

  const fs::path tmp = dir / (layout.manifest_file + ".tmp");
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return tl::unexpected(ErrorCode::IOError);
    out << body.str();
    out.flush();
    if (!out) return tl::unexpected(ErrorCode::IOError);
  }
  fs::rename(tmp, dir / layout.manifest_file, ec);
  if (ec) return tl::unexpected(ErrorCode::IOError);
  return {};
}

Expected<void> remove_cache(const fs::path& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) return tl::unexpected(ErrorCode::IOError);
  return {};
}
} // namespace aed::model
