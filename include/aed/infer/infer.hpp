#pragma once
#include <cstdint>
#include <memory>
#include <span>

#include "aed/model/model.hpp"
#include "aed/util/util.hpp"

namespace aed::infer {
/**
 * Framing of the waveform into classifier patches.
 * Units: samples at the model rate.
 *  - window_samples: 15600 (0.975 s at 16 kHz)
 *  - hop_samples: 7680 (0.48 s), the frame stride of the ProbabilityMatrix
 *  - batch_frames: frames per forward pass (capped by the handle's limit)
 */
struct FramingParams {
  std::uint32_t window_samples{15600};
  std::uint32_t hop_samples{7680};
  std::uint32_t batch_frames{32};
};

/** Number of frames for n samples: ceil(n / hop); 0 when n == 0 or hop == 0. */
std::uint32_t frame_count(std::size_t n, std::uint32_t hop) noexcept;

/**
 * Purpose: Cut frames [first, first + count) out of x.
 * Postconditions:
 *  - Frame i holds x[i*hop .. i*hop + window), zero padded past the end of x
 *  - InvalidArgument for window == 0, hop == 0 or first + count > frame_count(x)
 * Complexity: O(count * window).
 * Thread-safety: YES (pure).
 */
util::Expected<util::FrameBlock> make_frames(std::span<const float> x, const FramingParams& p,
                                             std::uint32_t first, std::uint32_t count);

/** All frames of x. */
util::Expected<util::FrameBlock> make_frames(std::span<const float> x, const FramingParams& p);

/**
 * Runs a model handle over a normalized waveform.
 */
class IInferenceEngine {
public:
  virtual ~IInferenceEngine() = default;

  /**
   * Purpose: Framewise class probabilities for the whole waveform.
   * Preconditions:
   *  - w.samples non-empty, w.sample_rate_hz == model.sample_rate_hz()
   *  - framing window == model.frame_window_samples()
   * Postconditions:
   *  - num_frames == frame_count(w.samples.size(), hop); rows in frame order
   *  - num_labels == model.labels().size(); labels shared with the handle
   *  - frame_stride_s == hop / sample rate
   *  - InferenceError for an empty or mis-sampled waveform or a runtime failure
   *  - CacheCorrupt passed through unchanged so the caller can self-heal
   * Complexity: O(frames * model cost); one forward pass per batch.
   * Thread-safety: YES (no shared mutable state; scratch is per call).
   */
  [[nodiscard]] virtual util::Expected<util::ProbabilityMatrix>
  infer(const util::Waveform& w, const model::IModelHandle& model) const = 0;
};

/** Batched engine over the given framing. */
std::unique_ptr<IInferenceEngine> make_default_engine(FramingParams params = {});
} // namespace aed::infer
