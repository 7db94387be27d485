#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "aed/audio/normalizer.hpp"
#include "aed/infer/infer.hpp"
#include "aed/model/model.hpp"
#include "aed/persist/persist.hpp"
#include "aed/shape/shape.hpp"
#include "aed/store/store.hpp"
#include "aed/util/logging.hpp"
#include "aed/util/util.hpp"

namespace aed::config {
/** Model cache used when AED_MODEL_CACHE_DIR is unset. */
inline constexpr std::string_view kDefaultCacheDir = "models/yamnet";

/**
 * Everything the executable needs to wire a pipeline.
 * Empty paths disable the collaborator they name (e.g. no upload_root → no
 * upload sink, no status_db → in-memory status records).
 */
struct PipelineConfig {
  audio::NormalizeParams normalize{};
  infer::FramingParams framing{};
  shape::ShapeParams shape{};
  model::LoaderOptions loader{};
  model::OnnxOptions onnx{};
  persist::PersistOptions persist{};
  store::LmdbOptions lmdb{};
  store::FetchOptions fetch{};

  std::filesystem::path model_mirror_dir; ///< AED_MODEL_MIRROR_DIR
  std::filesystem::path audio_root;       ///< AED_AUDIO_ROOT
  std::filesystem::path upload_root;      ///< AED_UPLOAD_ROOT
  std::filesystem::path status_db;        ///< AED_STATUS_DB (LMDB directory)
  LogVerbosity log_level{LogVerbosity::Info};
};

/** Variable lookup; nullopt when unset. */
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/** Lookup backed by the process environment. */
EnvLookup process_env();

/**
 * Purpose: Overlay AED_* variables on the defaults.
 * Postconditions: InvalidArgument when a numeric variable does not parse
 *                 completely or AED_LOG_LEVEL is unknown.
 */
util::Expected<PipelineConfig> load_from_env(const EnvLookup& env = process_env());

/**
 * Purpose: Range checks before wiring.
 * Postconditions: InvalidArgument for a non-finite threshold, segment_seconds
 *                 <= 0, top_n == 0, load attempts < 1, an empty cache dir or
 *                 an empty status flag.
 */
util::Expected<void> validate(const PipelineConfig& cfg);

// Strict parsers shared with the command line. Whole string must be consumed.
util::Expected<double> parse_double(std::string_view text);
util::Expected<long long> parse_int(std::string_view text);
} // namespace aed::config
