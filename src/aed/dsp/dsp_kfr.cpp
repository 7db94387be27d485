#include "aed/dsp/dsp.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <new>

#include "aed/util/logging.hpp"

namespace aed::dsp {
using aed::util::ErrorCode;
using aed::util::Expected;
using aed::util::PcmBuffer;
using aed::util::PcmSpan;
using aed::util::SampleRateHz;

std::size_t resampled_length(std::size_t n, SampleRateHz from_hz,
                             SampleRateHz to_hz) noexcept {
  if (from_hz == 0 || to_hz == 0) return 0;
  const double ratio = double(to_hz) / double(from_hz);
  return static_cast<std::size_t>(std::llround(double(n) * ratio));
}

// ==============================
// Resampler (KFR resampler class)
// ==============================
class ResamplerKfr final : public IResampler {
public:
  Expected<PcmBuffer>
  resample(const PcmSpan& in, const ResampleParams& rp) override {
    if (in.sample_rate_hz == 0 || rp.target_hz == 0)
      return tl::unexpected(ErrorCode::InvalidArgument);

    try {
      using T = float;

      // Copy input to KFR vector
      kfr::univector<T> in_uv(in.samples.begin(), in.samples.end());

      PcmBuffer out;
      out.sample_rate_hz = rp.target_hz;
      if (in_uv.empty()) return out; // empty in → empty out

      if (in.sample_rate_hz == rp.target_hz) {
        out.samples = std::move(in_uv);
        return out;
      }

      // Clamp quality to valid range (KFR supports discrete levels, 0..8 is safe)
      const int q = std::clamp(rp.quality, 0, 8);

      // Build resampler: (quality, out_sr, in_sr)
      auto r = kfr::resampler<T>(
          static_cast<kfr::sample_rate_conversion_quality>(q),
          static_cast<int>(rp.target_hz),
          static_cast<int>(in.sample_rate_hz));

      kfr::univector<T> out_uv(resampled_length(in_uv.size(), in.sample_rate_hz, rp.target_hz));

      // KFR: writes exactly out_uv.size() samples; returns number of input samples consumed
      (void)r.process(out_uv, in_uv);

      out.samples = std::move(out_uv);
      return out;
    } catch (const std::bad_alloc&) {
      return tl::unexpected(ErrorCode::OutOfMemory);
    } catch (const std::exception& e) {
      AED_LOG_WARN("resampler failed " << in.sample_rate_hz << " -> "
                   << rp.target_hz << ": " << e.what());
      return tl::unexpected(ErrorCode::DspError);
    }
  }
};


// ==============================
// Factory
// ==============================

class DefaultDspFactory final : public IDspFactory {
public:
  [[nodiscard]] std::unique_ptr<IResampler> create_resampler() const override {
    return std::make_unique<ResamplerKfr>();
  }
};

std::unique_ptr<IDspFactory> make_default_dsp_factory() {
  return std::make_unique<DefaultDspFactory>();
}
} // namespace aed::dsp
