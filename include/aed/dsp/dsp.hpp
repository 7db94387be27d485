#pragma once
#include <memory>
#include <span>
#include <cstdint>

#include <kfr/all.hpp>   // univector, resampler
#include <kfr/dsp.hpp>
#include "aed/util/util.hpp"

namespace aed::dsp {
//==============================
// Parameters
//==============================

/**
 * Fractional resampling configuration (KFR resampler).
 * Units:
 *  - target_hz: Hz (output sample rate)
 *  - quality: implementation-defined quality level (KFR ctor expects an int)
 */
struct ResampleParams {
  aed::util::SampleRateHz target_hz{}; ///< Hz
  int quality{8};
  ///< KFR resampler quality (0=fast .. 8=normal; values above 8 are clamped)
};

/**
 * Output length for a rate conversion: round(N * target / source).
 * Returns 0 when either rate is 0.
 */
std::size_t resampled_length(std::size_t n, aed::util::SampleRateHz from_hz,
                             aed::util::SampleRateHz to_hz) noexcept;

//==============================
// Fractional resampler (KFR)
//==============================

/**
 * Stateless one-shot resampling using KFR resampler (constructed per call).
 * Thread-safe: YES (no shared state across calls).
 */
class IResampler {
public:
  virtual ~IResampler() = default;

  /**
   * Purpose: Resample mono PCM to target sample rate (Hz) using KFR.
   * Preconditions:
   *  - in.sample_rate_hz > 0
   *  - rp.target_hz > 0
   * Postconditions:
   *  - Returns mono PCM with sample_rate_hz == rp.target_hz
   *  - Output length == resampled_length(in.samples.size(), in.sample_rate_hz, rp.target_hz)
   *  - Equal rates return a copy of the input
   * Units: Hz for sample rates.
   * Complexity: O(N) (as implemented by KFR).
   * Thread-safety: YES (stateless; constructs KFR resampler locally).
   */
  virtual aed::util::Expected<aed::util::PcmBuffer>
  resample(const aed::util::PcmSpan& in, const ResampleParams& rp) = 0;
};

//==============================
// Factory
//==============================

class IDspFactory {
public:
  virtual ~IDspFactory() = default;

  /** Create resampler (KFR) */
  [[nodiscard]] virtual std::unique_ptr<IResampler> create_resampler() const =
  0;
};

/** Default KFR-only DSP factory. */
std::unique_ptr<IDspFactory> make_default_dsp_factory();
} // namespace aed::dsp
