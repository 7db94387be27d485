#include "aed/model/model.hpp"

#include <system_error>
#include <unistd.h>
#include <utility>

#include "aed/util/logging.hpp"

namespace aed::model {
using aed::util::ErrorCode;
using aed::util::Expected;
namespace fs = std::filesystem;

namespace {

// Copies the artifacts from a directory (shared volume, pre-seeded image) into
// a sibling staging directory, writes the manifest, then renames into place.
class MirrorModelSource final : public IModelSource {
public:
  explicit MirrorModelSource(fs::path mirror) : mirror_(std::move(mirror)) {}

  Expected<void> fetch_into(const fs::path& dir, const CacheLayout& layout) override {
    std::error_code ec;
    if (!fs::is_directory(mirror_, ec)) {
      AED_LOG_WARN("model mirror " << mirror_.string() << " is not reachable");
      return tl::unexpected(ErrorCode::Unavailable);
    }

    const fs::path staging = dir.parent_path() /
        (dir.filename().string() + ".partial-" + std::to_string(::getpid()));
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) return tl::unexpected(ErrorCode::IOError);

    auto fail = [&](ErrorCode code) -> Expected<void> {
      std::error_code ignored;
      fs::remove_all(staging, ignored);
      return tl::unexpected(code);
    };

    for (const auto* name : {&layout.model_file, &layout.class_map_file}) {
      const fs::path from = mirror_ / *name;
      if (!fs::is_regular_file(from, ec)) return fail(ErrorCode::Unavailable);
      fs::copy_file(from, staging / *name, fs::copy_options::overwrite_existing, ec);
      if (ec) {
        AED_LOG_WARN("copy " << from.string() << " failed: " << ec.message());
        return fail(ErrorCode::IOError);
      }
    }

    if (auto m = write_manifest(staging, layout); !m) return fail(m.error());

    fs::remove_all(dir, ec);
    if (ec) return fail(ErrorCode::IOError);
    if (dir.has_parent_path()) fs::create_directories(dir.parent_path(), ec);
    fs::rename(staging, dir, ec);
    if (ec) return fail(ErrorCode::IOError);
    return {};
  }

private:
  fs::path mirror_;
};

} // namespace

std::shared_ptr<IModelSource> make_mirror_model_source(fs::path mirror_dir) {
  return std::make_shared<MirrorModelSource>(std::move(mirror_dir));
}
} // namespace aed::model
