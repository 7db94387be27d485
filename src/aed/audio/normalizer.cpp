#include "aed/audio/normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "aed/util/logging.hpp"

namespace aed::audio {
using aed::util::ErrorCode;
using aed::util::Expected;
using aed::util::PcmSpan;
using aed::util::Waveform;

std::size_t max_samples(const NormalizeParams& p) noexcept {
  if (p.max_duration_s <= 0.0) return 0;
  return static_cast<std::size_t>(
      std::llround(p.max_duration_s * static_cast<double>(p.target_rate_hz)));
}

float peak_abs(std::span<const float> x) noexcept {
  float m = 0.0f;
  for (float v : x) m = std::max(m, std::abs(v));
  return m;
}

float compute_rms(std::span<const float> x) noexcept {
  if (x.empty()) return 0.0f;
  double acc = 0.0;
  for (float v : x) acc += static_cast<double>(v) * static_cast<double>(v);
  return static_cast<float>(std::sqrt(acc / static_cast<double>(x.size())));
}

namespace {

void clamp_unit(kfr::univector<float>& x) {
  for (auto& v : x) {
    if (v > 1.0f) v = 1.0f;
    else if (v < -1.0f) v = -1.0f;
  }
}

void normalize_peak_inplace(kfr::univector<float>& x) {
  const float peak = peak_abs(std::span<const float>(x.data(), x.size()));
  if (peak > 1.0f) {
    const float inv = 1.0f / peak;
    for (auto& v : x) v *= inv;
  }
  // Division can land one ulp outside the range.
  clamp_unit(x);
}

// Scale to target dBFS (clamped to avoid extreme gains).
void normalize_rms_inplace(kfr::univector<float>& x, float target_dbfs) {
  const float target_lin = std::pow(10.0f, target_dbfs * 0.05f); // 20*log10(s)=dB → s=10^(dB/20)
  const float rms = compute_rms(std::span<const float>(x.data(), x.size()));
  if (rms > std::numeric_limits<float>::min()) {
    float gain = target_lin / rms;
    if (gain > 16.0f) gain = 16.0f;
    for (auto& v : x) v *= gain;
  }
  clamp_unit(x);
}

} // namespace

Expected<Waveform> condition(aed::io::DecodedAudio decoded, const NormalizeParams& p,
                             aed::dsp::IResampler& resampler) {
  if (p.target_rate_hz == 0 || !(p.max_duration_s > 0.0))
    return tl::unexpected(ErrorCode::InvalidArgument);
  if (decoded.pcm.sample_rate_hz == 0) return tl::unexpected(ErrorCode::InvalidArgument);
  if (decoded.pcm.samples.empty()) return tl::unexpected(ErrorCode::FormatError);

  // Non-finite samples would smear across the resampler's filter taps.
  for (auto& v : decoded.pcm.samples) {
    if (!std::isfinite(v)) v = 0.0f;
  }

  const auto source_rate = decoded.pcm.sample_rate_hz;
  auto resampled = resampler.resample(
      PcmSpan{source_rate, aed::util::as_span(std::as_const(decoded.pcm))},
      aed::dsp::ResampleParams{p.target_rate_hz, p.resample_quality});
  if (!resampled) return tl::unexpected(resampled.error());

  Waveform w;
  w.sample_rate_hz = p.target_rate_hz;
  w.original_sample_rate_hz = source_rate;
  w.truncated = decoded.truncated;
  w.samples = std::move(resampled->samples);

  const std::size_t cap = max_samples(p);
  if (w.samples.size() > cap) {
    w.samples.resize(cap);
    w.truncated = true;
  }
  if (w.samples.empty()) return tl::unexpected(ErrorCode::FormatError);

  switch (p.amplitude) {
    case AmplitudeMode::Peak:
      normalize_peak_inplace(w.samples);
      break;
    case AmplitudeMode::Rms:
      normalize_rms_inplace(w.samples, p.target_rms_dbfs);
      break;
  }

  if (w.truncated) {
    AED_LOG_DEBUG("source longer than " << p.max_duration_s << " s, kept first "
                  << w.samples.size() << " samples");
  }
  return w;
}

class DefaultSignalNormalizer final : public ISignalNormalizer {
public:
  DefaultSignalNormalizer(std::unique_ptr<aed::io::IAudioDecoder> decoder,
                          std::unique_ptr<aed::dsp::IResampler> resampler)
    : decoder_(std::move(decoder)), resampler_(std::move(resampler)) {}

  Expected<Waveform> normalize(std::span<const std::byte> data,
                               const NormalizeParams& p) override {
    auto decoded = decoder_->decode_bytes(data, decode_params(p));
    if (!decoded) return tl::unexpected(decoded.error());
    return condition(std::move(*decoded), p, *resampler_);
  }

  Expected<Waveform> normalize_file(std::string_view path,
                                    const NormalizeParams& p) override {
    auto decoded = decoder_->decode_file(path, decode_params(p));
    if (!decoded) return tl::unexpected(decoded.error());
    return condition(std::move(*decoded), p, *resampler_);
  }

private:
  static aed::io::DecodeParams decode_params(const NormalizeParams& p) {
    aed::io::DecodeParams d;
    d.max_seconds = p.max_duration_s;
    return d;
  }

  std::unique_ptr<aed::io::IAudioDecoder> decoder_;
  std::unique_ptr<aed::dsp::IResampler> resampler_;
};

std::unique_ptr<ISignalNormalizer>
make_normalizer(const aed::io::IDecoderFactory& decoders, const aed::dsp::IDspFactory& dsp) {
  return std::make_unique<DefaultSignalNormalizer>(decoders.create_decoder(),
                                                   dsp.create_resampler());
}

std::unique_ptr<ISignalNormalizer> make_default_normalizer() {
  auto decoders = aed::io::make_default_decoder_factory();
  auto dsp = aed::dsp::make_default_dsp_factory();
  return make_normalizer(*decoders, *dsp);
}
} // namespace aed::audio
