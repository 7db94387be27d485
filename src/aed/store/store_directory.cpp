#include "aed/store/store.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include "aed/util/logging.hpp"

namespace aed::store {
using aed::util::ErrorCode;
using aed::util::Expected;
namespace fs = std::filesystem;

namespace {

bool safe_relative_key(std::string_view key) {
  if (key.empty()) return false;
  const fs::path p{std::string(key)};
  if (p.is_absolute() || p.has_root_name()) return false;
  for (const auto& part : p) {
    if (part == "..") return false;
  }
  return true;
}

class DirectoryAudioSource final : public IAudioSource {
public:
  explicit DirectoryAudioSource(fs::path root) : root_(std::move(root)) {}

  Expected<std::vector<std::byte>> fetch(std::string_view key, const FetchOptions& opts) override {
    if (!safe_relative_key(key)) return tl::unexpected(ErrorCode::InvalidArgument);
    const auto deadline = util::Deadline::after(opts.timeout);
    const fs::path p = root_ / std::string(key);

    std::error_code ec;
    const auto status = fs::status(p, ec);
    if (ec || !fs::exists(status)) {
      if (!fs::is_directory(root_, ec)) {
        AED_LOG_WARN("audio root " << root_.string() << " is not reachable");
        return tl::unexpected(ErrorCode::Unavailable);
      }
      return tl::unexpected(ErrorCode::NotFound);
    }
    if (!fs::is_regular_file(status)) return tl::unexpected(ErrorCode::IOError);

    std::ifstream in(p, std::ios::binary);
    if (!in) return tl::unexpected(ErrorCode::IOError);

    constexpr std::size_t CHUNK = 1u << 20;
    std::vector<std::byte> out;
    for (;;) {
      if (deadline.expired()) {
        AED_LOG_WARN("fetch " << key << " timed out after " << opts.timeout.count() << " ms");
        return tl::unexpected(ErrorCode::Timeout);
      }
      const std::size_t prev = out.size();
      out.resize(prev + CHUNK);
      in.read(reinterpret_cast<char*>(out.data() + prev), static_cast<std::streamsize>(CHUNK));
      const auto got = static_cast<std::size_t>(in.gcount());
      out.resize(prev + got);
      if (in.bad()) return tl::unexpected(ErrorCode::IOError);
      if (got < CHUNK) break;
    }
    return out;
  }

private:
  fs::path root_;
};

} // namespace

std::unique_ptr<IAudioSource> make_directory_audio_source(fs::path root) {
  return std::make_unique<DirectoryAudioSource>(std::move(root));
}
} // namespace aed::store
