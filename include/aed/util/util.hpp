#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <kfr/all.hpp>          // KFR: univector
#include <tl/expected.hpp>      // tl::expected

namespace aed::util {
// -----------------------------
// Error domain (no exceptions)
// -----------------------------

/**
 * Recoverable errors shared by every pipeline stage.
 * No exceptions are thrown across module boundaries.
 *
 * Meanings:
 *  - InvalidArgument: argument value/range preconditions violated
 *  - SizeMismatch: shape/length/buffer size mismatch
 *  - OutOfMemory: allocation failed or growth could not be satisfied
 *  - IOError: file, device or store I/O failure
 *  - DecodeError: unsupported or corrupt audio container
 *  - FormatError: container decoded but the signal is empty
 *  - UnsupportedFormat: format/container not supported by current build
 *  - DspError: generic DSP failure (numerical or backend)
 *  - NotFound: resource/key missing (not a hard failure in many lookups)
 *  - Unavailable: subsystem not initialized/open or currently unavailable
 *  - Timeout: operation exceeded allowed time
 *  - CacheCorrupt: on-disk model cache is incomplete or unreadable
 *  - ModelUnavailable: no usable model after all acquisition attempts
 *  - InferenceError: classifier rejected the input or failed to run
 *  - PersistenceError: a result sink could not record the output
 *  - ResourceExhausted: store full or quota reached
 *  - Internal: invariant broken or unexpected state (bug)
 */
enum class ErrorCode : std::uint16_t {
  None = 0,
  InvalidArgument,
  SizeMismatch,
  OutOfMemory,
  IOError,
  DecodeError,
  FormatError,
  UnsupportedFormat,
  DspError,
  NotFound,
  Unavailable,
  Timeout,
  CacheCorrupt,
  ModelUnavailable,
  InferenceError,
  PersistenceError,
  ResourceExhausted,
  Internal
};

/** Short, stable name for an error. Thread-safe. */
std::string_view error_name(ErrorCode) noexcept;

/** Human-friendly description. Thread-safe. */
std::string_view error_description(ErrorCode) noexcept;

/** Project-wide expected alias. Prefer returning this in APIs that can fail. */
template <typename T>
using Expected = tl::expected<T, ErrorCode>;

// -----------------------------
// Scalar/time/index aliases
// -----------------------------

using SampleRateHz = std::uint32_t; // Hertz
using FrameIndex = std::uint32_t; // classifier frame number
using LabelIndex = std::uint16_t; // position in the label set

// -----------------------------
// Deadlines
// -----------------------------

/**
 * Absolute steady-clock deadline. A default-constructed deadline never expires.
 * Trivially copyable; pass by value.
 */
class Deadline {
public:
  using Clock = std::chrono::steady_clock;

  Deadline() = default;

  explicit Deadline(Clock::time_point at) : at_(at), bounded_(true) {}

  static Deadline after(std::chrono::milliseconds timeout) {
    return Deadline(Clock::now() + timeout);
  }

  [[nodiscard]] bool bounded() const noexcept { return bounded_; }

  [[nodiscard]] bool expired() const noexcept {
    return bounded_ && Clock::now() >= at_;
  }

  /** Time left; zero once expired, max() when unbounded. */
  [[nodiscard]] std::chrono::milliseconds remaining() const noexcept {
    if (!bounded_) return std::chrono::milliseconds::max();
    const auto now = Clock::now();
    if (now >= at_) return std::chrono::milliseconds::zero();
    return std::chrono::duration_cast<std::chrono::milliseconds>(at_ - now);
  }

private:
  Clock::time_point at_{};
  bool bounded_{false};
};

// -----------------------------
// Buffer/view conventions
// -----------------------------
//
// Policy:
//  * Own DSP-sized buffers with kfr::univector<T> (SIMD-friendly).
//  * Accept std::span<T> / std::span<const T> on public boundaries (zero copy).
//  * No global state; all types are trivially movable; thread-safe when treated as immutable.
//

/** Owning mono PCM buffer (float32). */
struct PcmBuffer {
  kfr::univector<float> samples; // owning, contiguous, SIMD-capable
  SampleRateHz sample_rate_hz{};
  // Thread-safety: safe for concurrent const access; mutations must be external.
};

/** Non-owning API boundary view of mono PCM. */
struct PcmSpan {
  SampleRateHz sample_rate_hz{};
  std::span<const float> samples; // no ownership; lifetime managed by caller
};

/**
 * Classifier-ready signal: mono, model sample rate, amplitude in [-1, 1].
 * Owned by the processing of exactly one audio unit.
 */
struct Waveform {
  kfr::univector<float> samples;
  SampleRateHz sample_rate_hz{}; // always the model rate after normalization
  SampleRateHz original_sample_rate_hz{}; // rate of the decoded source
  bool truncated{false}; // source exceeded the maximum duration and was cut

  [[nodiscard]] double duration_s() const noexcept {
    if (sample_rate_hz == 0) return 0.0;
    return static_cast<double>(samples.size()) / static_cast<double>(sample_rate_hz);
  }
};

/** Framing block (owning, row-major [frame][sample]). */
struct FrameBlock {
  std::uint32_t frame_size{}; // samples per frame
  std::uint32_t hop_size{}; // samples
  std::uint32_t num_frames{}; // number of frames
  kfr::univector<float> data; // size = num_frames * frame_size

  // Access contract: frame i maps to contiguous subrange of length frame_size.
  // Thread-safety: safe for concurrent const access; not thread-safe for mutation.
};

/** Immutable label names shared by every matrix produced by one model. */
using LabelNames = std::shared_ptr<const std::vector<std::string>>;

/**
 * Framewise class probabilities, row-major [frame][label].
 * Invariants: scores.size() == num_frames * num_labels;
 *             labels->size() == num_labels.
 */
struct ProbabilityMatrix {
  std::uint32_t num_frames{};
  std::uint16_t num_labels{};
  double frame_stride_s{}; // seconds between consecutive frame starts
  kfr::univector<float> scores;
  LabelNames labels;
  // Thread-safety: safe for concurrent const access.
};

/** One (label, probability) pair that survived a threshold or a ranking. */
struct DetectionEvent {
  LabelIndex label_index{};
  std::string label;
  float probability{};
};

// -----------------------------
// Zero-copy helpers (header-only, noexcept)
// -----------------------------

/** Convenience: view over PcmBuffer samples (const). */
inline std::span<const float> as_span(const PcmBuffer& b) noexcept {
  return std::span<const float>(b.samples.data(), b.samples.size());
}

/** Convenience: view over PcmBuffer samples (mutable). */
inline std::span<float> as_span(PcmBuffer& b) noexcept {
  return std::span<float>(b.samples.data(), b.samples.size());
}

/** View over waveform samples (const). */
inline std::span<const float> as_span(const Waveform& w) noexcept {
  return std::span<const float>(w.samples.data(), w.samples.size());
}

/** Slice a frame i from FrameBlock as a const span. Preconditions: i < num_frames. */
inline std::span<const float> frame_view(const FrameBlock& fb,
                                         std::uint32_t i) noexcept {
  const std::size_t offset = static_cast<std::size_t>(i) * fb.frame_size;
  return std::span<const float>(fb.data.data() + offset, fb.frame_size);
}

/** Mutable slice of a frame i from FrameBlock. Preconditions: i < num_frames. */
inline std::span<float> frame_view(FrameBlock& fb, std::uint32_t i) noexcept {
  const std::size_t offset = static_cast<std::size_t>(i) * fb.frame_size;
  return std::span<float>(fb.data.data() + offset, fb.frame_size);
}

/** Probabilities of frame i (const). Preconditions: i < num_frames. */
inline std::span<const float> matrix_row(const ProbabilityMatrix& M,
                                         std::uint32_t i) noexcept {
  const std::size_t offset = static_cast<std::size_t>(i) * M.num_labels;
  return {M.scores.data() + offset, M.num_labels};
}

/** Label name for index k, empty when the matrix carries no names. */
inline std::string_view label_name(const ProbabilityMatrix& M,
                                   LabelIndex k) noexcept {
  if (!M.labels || k >= M.labels->size()) return {};
  return (*M.labels)[k];
}
} // namespace aed::util
