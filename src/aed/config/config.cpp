#include "aed/config/config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace aed::config {
using aed::util::ErrorCode;
using aed::util::Expected;

EnvLookup process_env() {
  return [](std::string_view name) -> std::optional<std::string> {
    const std::string key(name);
    const char* v = std::getenv(key.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
  };
}

Expected<double> parse_double(std::string_view text) {
  const std::string s(text);
  if (s.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(s.c_str(), &end);
  if (errno == ERANGE || end != s.c_str() + s.size()) return tl::unexpected(ErrorCode::InvalidArgument);
  return v;
}

Expected<long long> parse_int(std::string_view text) {
  const std::string s(text);
  if (s.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno == ERANGE || end != s.c_str() + s.size()) return tl::unexpected(ErrorCode::InvalidArgument);
  return v;
}

namespace {

Expected<void> read_ms(const EnvLookup& env, std::string_view name, std::chrono::milliseconds& out) {
  auto v = env(name);
  if (!v) return {};
  auto n = parse_int(*v);
  if (!n || *n < 0) return tl::unexpected(ErrorCode::InvalidArgument);
  out = std::chrono::milliseconds(*n);
  return {};
}

} // namespace

Expected<PipelineConfig> load_from_env(const EnvLookup& env) {
  PipelineConfig cfg;
  cfg.loader.cache_dir = kDefaultCacheDir;

  const std::pair<std::string_view, std::filesystem::path*> paths[] = {
    {"AED_MODEL_CACHE_DIR", &cfg.loader.cache_dir},
    {"AED_MODEL_MIRROR_DIR", &cfg.model_mirror_dir},
    {"AED_AUDIO_ROOT", &cfg.audio_root},
    {"AED_ARTIFACT_ROOT", &cfg.persist.artifact_root},
    {"AED_UPLOAD_ROOT", &cfg.upload_root},
    {"AED_STATUS_DB", &cfg.status_db},
  };
  for (const auto& [name, field] : paths) {
    if (auto v = env(name); v && !v->empty()) *field = *v;
  }

  if (auto v = env("AED_THRESHOLD")) {
    auto d = parse_double(*v);
    if (!d) return tl::unexpected(d.error());
    cfg.shape.threshold = static_cast<float>(*d);
  }
  if (auto v = env("AED_SEGMENT_SECONDS")) {
    auto d = parse_double(*v);
    if (!d) return tl::unexpected(d.error());
    cfg.shape.segment_seconds = *d;
  }
  if (auto v = env("AED_TOP_N")) {
    auto n = parse_int(*v);
    if (!n || *n < 0) return tl::unexpected(ErrorCode::InvalidArgument);
    cfg.shape.top_n = static_cast<std::size_t>(*n);
  }
  if (auto v = env("AED_LOAD_ATTEMPTS")) {
    auto n = parse_int(*v);
    if (!n || *n < 0) return tl::unexpected(ErrorCode::InvalidArgument);
    cfg.loader.max_attempts = static_cast<std::uint32_t>(*n);
  }
  if (auto r = read_ms(env, "AED_FETCH_TIMEOUT_MS", cfg.fetch.timeout); !r) return tl::unexpected(r.error());
  if (auto r = read_ms(env, "AED_PERSIST_TIMEOUT_MS", cfg.persist.timeout); !r) return tl::unexpected(r.error());
  if (auto r = read_ms(env, "AED_RETRY_DELAY_MS", cfg.loader.retry_delay); !r) return tl::unexpected(r.error());

  if (auto v = env("AED_STATUS_FLAG")) cfg.persist.status_flag = *v;
  if (auto v = env("AED_LOG_LEVEL")) {
    auto lvl = parse_log_verbosity(*v);
    if (!lvl) return tl::unexpected(ErrorCode::InvalidArgument);
    cfg.log_level = *lvl;
  }
  return cfg;
}

Expected<void> validate(const PipelineConfig& cfg) {
  if (!std::isfinite(cfg.shape.threshold)) return tl::unexpected(ErrorCode::InvalidArgument);
  if (!std::isfinite(cfg.shape.segment_seconds) || cfg.shape.segment_seconds <= 0.0) {
    return tl::unexpected(ErrorCode::InvalidArgument);
  }
  if (cfg.shape.top_n == 0) return tl::unexpected(ErrorCode::InvalidArgument);
  if (cfg.loader.max_attempts < 1) return tl::unexpected(ErrorCode::InvalidArgument);
  if (cfg.loader.cache_dir.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
  if (cfg.persist.status_flag.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
  if (cfg.normalize.max_duration_s <= 0.0 || cfg.normalize.target_rate_hz == 0) {
    return tl::unexpected(ErrorCode::InvalidArgument);
  }
  return {};
}
} // namespace aed::config
