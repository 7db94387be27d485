#pragma once
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <memory>
#include <span>
#include <string_view>

#include <tl/expected.hpp>

#include "aed/util/util.hpp"

namespace aed::io {
  /**
   * Parameters controlling decode-time processing.
   * All units are annotated in field comments.
   */
  struct DecodeParams {
    double max_seconds{0.0}; ///< Stop after ceil(max_seconds * source rate) frames (<= 0 = unlimited).
  };

  /** Frame cap for a stream at `rate_hz`; 0 means unlimited. */
  inline std::uint64_t max_frames_for(const DecodeParams &params, util::SampleRateHz rate_hz) noexcept {
    if (params.max_seconds <= 0.0 || rate_hz == 0) return 0;
    return static_cast<std::uint64_t>(std::ceil(params.max_seconds * static_cast<double>(rate_hz)));
  }

  /**
   * Decoded mono PCM plus facts about the source stream.
   */
  struct DecodedAudio {
    util::PcmBuffer pcm; ///< mono float32 at the source sample rate
    std::uint16_t source_channels{}; ///< channel count before downmix
    bool truncated{false}; ///< source continued past params.max_seconds
  };

  /**
   * Downmix multi-channel PCM to mono (energy-preserving).
   * Implementations should average channels or use energy weights.
   */
  class IDownmixer {
  public:
    virtual ~IDownmixer() = default;

    /**
     * Purpose: Convert >=1 channel PCM streams to mono.
     * Preconditions:
     *  - channels.size() >= 1
     *  - All channels have identical sample_rate_hz and length
     *  - Input spans remain valid for the duration of the call
     * Postconditions:
     *  - Returned PcmBuffer contains the per-sample channel mean
     *  - sample_rate_hz preserved from inputs
     * Complexity: O(N * C) over total samples (N frames, C channels)
     * Thread-safety: YES (stateless, no shared mutable state)
     */
    [[nodiscard]] virtual util::Expected<util::PcmBuffer>
    to_mono(std::span<const util::PcmSpan> channels) const = 0;
  };

  /**
   * Decode audio from file or memory into mono float32 PCM (owning).
   * Implementations downmix internally using IDownmixer.
   */
  class IAudioDecoder {
  public:
    virtual ~IAudioDecoder() = default;

    /**
     * Purpose: Decode an entire file to mono float32 PCM.
     * Preconditions:
     *  - path is a readable file (UTF-8 or native encoding)
     * Postconditions:
     *  - On success, returns mono PCM with sample_rate_hz set
     *  - DecodeError when the container is unknown or corrupt
     *  - FormatError when the container is valid but holds zero frames
     * Complexity: O(N) over decoded sample frames
     * Thread-safety: NO (decoder instances maintain internal scratch); use one instance per thread
     */
    virtual util::Expected<DecodedAudio>
    decode_file(std::string_view path, const DecodeParams &params) = 0;

    /**
     * Purpose: Decode from an in-memory container (entire encoded stream).
     * Preconditions:
     *  - data holds a full encoded stream (container+codec)
     * Postconditions:
     *  - Same as decode_file
     * Complexity: O(N)
     * Thread-safety: NO (per-instance scratch); use separate instances per thread
     */
    virtual util::Expected<DecodedAudio>
    decode_bytes(std::span<const std::byte> data, const DecodeParams &params) = 0;
  };

  /**
   * Abstract factory for decoders. Concrete factories may choose specific backends.
   */
  class IDecoderFactory {
  public:
    virtual ~IDecoderFactory() = default;

    /**
     * Purpose: Create a decoder suitable for WAV/MP3/FLAC based on internal strategy.
     * Postconditions: Returned pointer is non-null; each instance is independent.
     * Thread-safety: YES (factory is stateless).
     */
    [[nodiscard]] virtual std::unique_ptr<IAudioDecoder> create_decoder() const = 0;
  };

  /**
   * Create a default, composite-decoder factory that supports:
   *  - WAV via dr_wav (PCM 8/16/24/32-bit, float32)
   *  - MP3 via dr_mp3 (MPEG-1/2 Layer III)
   *  - FLAC via dr_flac (16/24-bit)
   * The decoder auto-detects format by header sniffing or filename extension fallback.
   */
  std::unique_ptr<IDecoderFactory> make_default_decoder_factory();

  /**
   * Create a default downmixer that averages channels (energy-preserving).
   */
  std::unique_ptr<IDownmixer> make_default_downmixer();
} // namespace aed::io
