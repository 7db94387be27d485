#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include <kfr/all.hpp>
#include <tl/expected.hpp>

#include "aed/model/labels.hpp"
#include "aed/util/util.hpp"

namespace aed::model {
//==============================
// On-disk cache
//==============================

/**
 * File names inside a model cache directory.
 * The manifest lists `name size` per artifact and is written last; a cache
 * is complete iff the manifest exists and every listed file has the listed size.
 */
struct CacheLayout {
  std::string model_file{"yamnet.onnx"};
  std::string class_map_file{"yamnet_class_map.csv"};
  std::string manifest_file{"MANIFEST"};
};

/**
 * Purpose: Structural completeness check of a cache directory.
 * Postconditions:
 *  - NotFound if the directory does not exist
 *  - CacheCorrupt if the manifest is missing or malformed, does not list both
 *    artifacts, or any listed file is absent or has a different size
 * Complexity: O(files).
 * Thread-safety: YES (read-only filesystem access).
 */
util::Expected<void> validate_cache(const std::filesystem::path& dir, const CacheLayout& layout);

/**
 * Purpose: Record the current sizes of the layout's artifacts in the manifest.
 * Preconditions: both artifacts exist in dir.
 * Postconditions: manifest replaced atomically (temp file + rename); NotFound
 *                 if an artifact is missing, IOError on write failure.
 */
util::Expected<void> write_manifest(const std::filesystem::path& dir, const CacheLayout& layout);

/** Delete the cache directory and everything in it. Missing directory is success. */
util::Expected<void> remove_cache(const std::filesystem::path& dir);

//==============================
// Model handle
//==============================

/**
 * A loaded classifier. Immutable after construction; classify() may be called
 * concurrently from several threads.
 */
class IModelHandle {
public:
  virtual ~IModelHandle() = default;

  /** Class names, one per output column. */
  [[nodiscard]] virtual const LabelSet& labels() const noexcept = 0;

  /** Input rate the classifier expects (Hz). */
  [[nodiscard]] virtual util::SampleRateHz sample_rate_hz() const noexcept = 0;

  /** Samples per input frame (15600 for YAMNet). */
  [[nodiscard]] virtual std::uint32_t frame_window_samples() const noexcept = 0;

  /** Largest frame count per classify() call; 0 means unbounded. */
  [[nodiscard]] virtual std::uint32_t max_batch_frames() const noexcept = 0;

  /** Incremented by the loader every time a handle is (re)created. */
  [[nodiscard]] virtual std::uint64_t generation() const noexcept = 0;

  /**
   * Purpose: One forward pass over a batch of frames.
   * Preconditions:
   *  - frames.size() == num_frames * frame_window_samples()
   *  - 0 < num_frames, and num_frames <= max_batch_frames() when bounded
   * Postconditions:
   *  - Returns num_frames * labels().size() probabilities, row-major [frame][label]
   *  - CacheCorrupt when the backing artifacts have vanished or are unreadable
   *  - InferenceError for any other runtime failure, SizeMismatch for bad input
   * Thread-safety: YES.
   */
  [[nodiscard]] virtual util::Expected<kfr::univector<float>>
  classify(std::span<const float> frames, std::uint32_t num_frames) const = 0;
};

using ModelHandlePtr = std::shared_ptr<const IModelHandle>;

/** Opens a validated cache directory into a handle (ONNX Runtime in production). */
class IModelRuntime {
public:
  virtual ~IModelRuntime() = default;

  /**
   * Purpose: Load model and class map from dir.
   * Postconditions: CacheCorrupt when an artifact cannot be parsed; IOError when unreadable.
   * Thread-safety: YES.
   */
  [[nodiscard]] virtual util::Expected<ModelHandlePtr>
  open(const std::filesystem::path& dir, const CacheLayout& layout, std::uint64_t generation) = 0;
};

/** Populates an empty cache directory ("download"). */
class IModelSource {
public:
  virtual ~IModelSource() = default;

  /**
   * Purpose: Materialize a complete cache at dir, manifest included.
   * Postconditions: on success validate_cache(dir) holds; on failure dir is
   *                 left absent or incomplete (never half-validated).
   *                 Unavailable when the source cannot be reached.
   */
  [[nodiscard]] virtual util::Expected<void>
  fetch_into(const std::filesystem::path& dir, const CacheLayout& layout) = 0;
};

/** Source that copies the artifacts from a local mirror directory. */
std::shared_ptr<IModelSource> make_mirror_model_source(std::filesystem::path mirror_dir);

/** ONNX Runtime knobs. */
struct OnnxOptions {
  int intra_op_threads{1};
  bool optimize{true};
  util::SampleRateHz sample_rate_hz{16000};
  std::uint32_t frame_window_samples{15600};
  std::string scores_output{"scores"}; ///< falls back to output 0 if absent
};

/**
 * Frames per forward pass allowed by a model input shape.
 *  - rank 1 [N]: a single waveform, so 1
 *  - rank 2 [B, N] with fixed B > 0: B
 *  - rank 2 with a dynamic batch (B <= 0): 0 (unbounded)
 */
std::uint32_t batch_limit_for_input_shape(std::span<const std::int64_t> shape) noexcept;

/** Runtime executing the classifier with ONNX Runtime (CPU). */
std::shared_ptr<IModelRuntime> make_onnx_runtime(OnnxOptions options = {});

//==============================
// Model loader (self-healing)
//==============================

enum class LoaderState : std::uint8_t { Unloaded, Validating, Loaded, Recovering };

std::string_view loader_state_name(LoaderState s) noexcept;

struct LoaderOptions {
  std::filesystem::path cache_dir;
  CacheLayout layout{};
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds retry_delay{5000};
  std::size_t expected_labels{kYamnetLabelCount}; ///< 0 accepts any count
  bool warm_up{true}; ///< run one frame of silence before publishing a handle
};

/**
 * Owns the process-wide ModelHandle and the acquisition protocol.
 *
 * States: Unloaded → Validating → Loaded. Recovering is entered from
 * Validating (incomplete cache) or from recover() after an inference hit
 * CacheCorrupt. Each attempt: validate → (delete + fetch + re-validate) →
 * open → warm up. Up to max_attempts attempts separated by retry_delay, then
 * ModelUnavailable and back to Unloaded.
 *
 * Thread-safety: YES. acquire/recover/invalidate are serialized by one mutex,
 * so at most one load or recovery runs at a time. state() and recoveries()
 * never block.
 */
class ModelLoader {
public:
  ModelLoader(LoaderOptions options,
              std::shared_ptr<IModelRuntime> runtime,
              std::shared_ptr<IModelSource> source);

  ModelLoader(const ModelLoader&) = delete;
  ModelLoader& operator=(const ModelLoader&) = delete;

  /** Cached handle if loaded, else run the protocol. */
  [[nodiscard]] util::Expected<ModelHandlePtr> acquire();

  /**
   * Purpose: Self-heal after `failed` reported CacheCorrupt.
   * Postconditions:
   *  - If the current handle is no longer `failed` (another caller already
   *    recovered), the current handle is returned without reloading
   *  - Otherwise the cache is deleted and the protocol re-run
   */
  [[nodiscard]] util::Expected<ModelHandlePtr> recover(const ModelHandlePtr& failed);

  /** Drop the cached handle; the next acquire() reloads. Cache files are kept. */
  void invalidate();

  [[nodiscard]] LoaderState state() const noexcept { return state_.load(); }

  /** Number of completed recover() reloads. */
  [[nodiscard]] std::uint64_t recoveries() const noexcept { return recoveries_.load(); }

  [[nodiscard]] const LoaderOptions& options() const noexcept { return options_; }

private:
  util::Expected<ModelHandlePtr> load_locked(bool purge_first);
  util::Expected<ModelHandlePtr> attempt_locked();
  void set_state(LoaderState s);

  LoaderOptions options_;
  std::shared_ptr<IModelRuntime> runtime_;
  std::shared_ptr<IModelSource> source_;

  std::mutex mu_;
  ModelHandlePtr current_;
  std::uint64_t generation_{0};
  std::atomic<LoaderState> state_{LoaderState::Unloaded};
  std::atomic<std::uint64_t> recoveries_{0};
};
} // namespace aed::model
