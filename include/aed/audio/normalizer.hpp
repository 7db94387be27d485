#pragma once
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

#include "aed/dsp/dsp.hpp"
#include "aed/io/io.hpp"
#include "aed/util/util.hpp"

namespace aed::audio {
//==============================
// Parameters
//==============================

/** Classifier input rate (YAMNet). */
inline constexpr util::SampleRateHz kModelSampleRateHz = 16000;

/** Longest signal handed to the classifier; the rest of the source is dropped. */
inline constexpr double kMaxDurationSeconds = 60.0;

/**
 * Amplitude policy applied after resampling.
 *  - Peak: attenuate only. If max |x| > 1 the signal is divided by it; quieter
 *    signals pass through untouched, so relative dynamics are preserved.
 *  - Rms: scale to target_rms_dbfs (gain capped at 16x), then clamp to [-1, 1].
 */
enum class AmplitudeMode { Peak, Rms };

/**
 * Normalizer configuration.
 * Units:
 *  - target_rate_hz: Hz
 *  - max_duration_s: seconds (> 0)
 *  - target_rms_dbfs: dBFS (Rms mode only)
 */
struct NormalizeParams {
  util::SampleRateHz target_rate_hz{kModelSampleRateHz};
  double max_duration_s{kMaxDurationSeconds};
  AmplitudeMode amplitude{AmplitudeMode::Peak};
  float target_rms_dbfs{-20.0f};
  int resample_quality{8}; ///< forwarded to dsp::ResampleParams::quality
};

/** Largest sample count allowed at the target rate (e.g. 960000 for 60 s at 16 kHz). */
std::size_t max_samples(const NormalizeParams& p) noexcept;

/** Largest absolute sample value; 0 for an empty signal. */
float peak_abs(std::span<const float> x) noexcept;

/** Root mean square of x; 0 for an empty signal. */
float compute_rms(std::span<const float> x) noexcept;

/**
 * Purpose: Bring an already decoded mono signal into classifier format.
 * Steps: replace non-finite samples by 0, resample to p.target_rate_hz,
 *        cut to max_samples(p), apply the amplitude policy.
 * Preconditions:
 *  - decoded.pcm.sample_rate_hz > 0
 * Postconditions:
 *  - sample_rate_hz == p.target_rate_hz; every sample in [-1, 1]
 *  - original_sample_rate_hz == decoded.pcm.sample_rate_hz
 *  - truncated == decoded.truncated || the resampled signal was cut
 *  - FormatError when the signal is empty
 * Complexity: O(N) over source samples.
 * Thread-safety: YES if `resampler` is not shared with another thread.
 */
util::Expected<util::Waveform> condition(io::DecodedAudio decoded,
                                         const NormalizeParams& p,
                                         dsp::IResampler& resampler);

//==============================
// Signal normalizer
//==============================

/**
 * Raw encoded bytes → Waveform. Owns a decoder and a resampler.
 * Failure: DecodeError (unknown/corrupt container), FormatError (zero-length
 * signal), InvalidArgument (bad params), DspError (resampler failure).
 */
class ISignalNormalizer {
public:
  virtual ~ISignalNormalizer() = default;

  /**
   * Purpose: Decode and condition an in-memory encoded stream.
   * Preconditions:
   *  - p.target_rate_hz > 0, p.max_duration_s > 0
   * Postconditions:
   *  - Waveform duration <= p.max_duration_s; exactly p.max_duration_s and
   *    truncated == true when the source was longer
   * Complexity: O(N) over decoded samples (decoding stops after the cap).
   * Thread-safety: NO (owns a decoder with internal scratch); one instance per thread.
   */
  virtual util::Expected<util::Waveform>
  normalize(std::span<const std::byte> data, const NormalizeParams& p) = 0;

  /** Same as normalize() for a file on disk. */
  virtual util::Expected<util::Waveform>
  normalize_file(std::string_view path, const NormalizeParams& p) = 0;
};

/** Normalizer built from the given factories (decoder + resampler created once). */
std::unique_ptr<ISignalNormalizer>
make_normalizer(const io::IDecoderFactory& decoders, const dsp::IDspFactory& dsp);

/** Normalizer over the default dr_libs decoders and the KFR resampler. */
std::unique_ptr<ISignalNormalizer> make_default_normalizer();
} // namespace aed::audio
