#include "aed/io/io.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

#define DR_MP3_IMPLEMENTATION
#include <dr_mp3.h>

#define DR_FLAC_IMPLEMENTATION
#include <dr_flac.h>

namespace aed::io {
using aed::util::ErrorCode;
using aed::util::Expected;
using aed::util::PcmBuffer;
using aed::util::PcmSpan;
using aed::util::SampleRateHz;

// -------------------------------
// Helpers (internal, file-scope)
// -------------------------------

namespace {

inline bool iequals_ascii(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = a[i], cb = b[i];
    if ('A' <= ca && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
    if ('A' <= cb && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
    if (ca != cb) return false;
  }
  return true;
}

enum class SniffedFormat { Wav, Mp3, Flac, Unknown };

SniffedFormat sniff_header(std::span<const std::byte> data) {
  if (data.size() >= 12) {
    const char* p = reinterpret_cast<const char*>(data.data());
    if (std::memcmp(p, "RIFF", 4) == 0 && std::memcmp(p + 8, "WAVE", 4) == 0) return SniffedFormat::Wav;
  }
  if (data.size() >= 4) {
    const char* p = reinterpret_cast<const char*>(data.data());
    if (std::memcmp(p, "fLaC", 4) == 0) return SniffedFormat::Flac;
    if (std::memcmp(p, "ID3", 3) == 0) return SniffedFormat::Mp3;
    // Frame sync 0xFFEx: quick heuristic for MP3 (MPEG audio frame).
    const unsigned char b0 = static_cast<unsigned char>(p[0]);
    const unsigned char b1 = static_cast<unsigned char>(p[1]);
    if (b0 == 0xFF && (b1 & 0xE0) == 0xE0) return SniffedFormat::Mp3;
  }
  return SniffedFormat::Unknown;
}

SniffedFormat sniff_extension(std::string_view path) {
  auto ext = std::filesystem::path(path).extension().string();
  if (ext.empty()) return SniffedFormat::Unknown;
  if (iequals_ascii(ext, ".wav"))  return SniffedFormat::Wav;
  if (iequals_ascii(ext, ".mp3"))  return SniffedFormat::Mp3;
  if (iequals_ascii(ext, ".flac")) return SniffedFormat::Flac;
  return SniffedFormat::Unknown;
}

// Read interleaved float frames in chunks until the stream ends or the cap is reached.
// `read(n, dst)` returns the number of frames written to dst.
template <typename ReadFn>
kfr::univector<float> read_chunked(ReadFn&& read, std::uint32_t channels,
                                   std::uint64_t max_frames, bool& truncated) {
  constexpr std::uint64_t CHUNK = 1u << 14; // frames per read
  kfr::univector<float> interleaved;
  kfr::univector<float> chunk;
  std::uint64_t total = 0;
  truncated = false;
  for (;;) {
    std::uint64_t want = CHUNK;
    if (max_frames > 0) {
      if (total >= max_frames) {
        // One more frame tells whether the source continues.
        chunk.resize(channels);
        truncated = read(1, chunk.data()) > 0;
        break;
      }
      want = std::min(want, max_frames - total);
    }
    chunk.resize(static_cast<size_t>(want) * channels);
    const std::uint64_t got = read(want, chunk.data());
    if (got == 0) break;
    const size_t prev = interleaved.size();
    interleaved.resize(prev + static_cast<size_t>(got) * channels);
    std::memcpy(interleaved.data() + prev, chunk.data(),
                sizeof(float) * static_cast<size_t>(got) * channels);
    total += got;
  }
  return interleaved;
}

} // namespace

// -------------------------------
// Default Downmixer
// -------------------------------

class EnergyPreservingDownmixer final : public IDownmixer {
public:
  [[nodiscard]] Expected<PcmBuffer> to_mono(std::span<const PcmSpan> channels) const override {
    if (channels.empty()) return tl::unexpected(ErrorCode::InvalidArgument);

    const SampleRateHz sr = channels[0].sample_rate_hz;
    const size_t N = channels[0].samples.size();
    for (const auto& ch : channels) {
      if (ch.sample_rate_hz != sr) return tl::unexpected(ErrorCode::SizeMismatch);
      if (ch.samples.size() != N)   return tl::unexpected(ErrorCode::SizeMismatch);
    }

    PcmBuffer out;
    out.sample_rate_hz = sr;
    out.samples.resize(N);

    const float invC = 1.0f / static_cast<float>(channels.size());
    for (size_t i = 0; i < N; ++i) {
      float acc = 0.0f;
      for (const auto& ch : channels) acc += ch.samples[i];
      out.samples[i] = acc * invC;
    }
    return out;
  }
};

std::unique_ptr<IDownmixer> make_default_downmixer() {
  return std::make_unique<EnergyPreservingDownmixer>();
}

namespace {

// Deinterleave → channel spans → mono. Zero frames is a FormatError (valid container, empty signal).
Expected<DecodedAudio> to_decoded(const kfr::univector<float>& interleaved,
                                  std::uint32_t channels, SampleRateHz sr,
                                  bool truncated, const IDownmixer& downmixer) {
  const size_t frames = (channels > 0) ? interleaved.size() / channels : 0;
  if (frames == 0) return tl::unexpected(ErrorCode::FormatError);

  DecodedAudio out;
  out.source_channels = static_cast<std::uint16_t>(channels);
  out.truncated = truncated;

  if (channels == 1) {
    out.pcm.sample_rate_hz = sr;
    out.pcm.samples = kfr::univector<float>(interleaved.begin(), interleaved.begin() + frames);
    return out;
  }

  std::vector<kfr::univector<float>> ch_data(channels);
  for (uint32_t c = 0; c < channels; ++c) ch_data[c].resize(frames);
  for (size_t i = 0; i < frames; ++i) {
    const float* row = interleaved.data() + i * channels;
    for (uint32_t c = 0; c < channels; ++c) ch_data[c][i] = row[c];
  }

  std::vector<PcmSpan> spans;
  spans.reserve(channels);
  for (uint32_t c = 0; c < channels; ++c) {
    spans.push_back(PcmSpan{ sr, std::span<const float>(ch_data[c].data(), ch_data[c].size()) });
  }

  auto mono = downmixer.to_mono(spans);
  if (!mono) return tl::unexpected(mono.error());
  out.pcm = std::move(*mono);
  out.pcm.sample_rate_hz = sr;
  return out;
}

} // namespace

// -------------------------------
// WAV Decoder (dr_wav)
// -------------------------------
//
// Supported:
//  - Container: RIFF/WAVE
//  - Formats: PCM 8/16/24/32-bit, IEEE float32
//  - Channels: 1..8 (downmixed to mono)
//
// Thread-safety: instance NOT thread-safe (internal scratch during decode).
//

class DrWavDecoder final : public IAudioDecoder {
public:
  explicit DrWavDecoder(std::unique_ptr<IDownmixer> dm)
    : downmixer_(std::move(dm)) {}

  Expected<DecodedAudio> decode_file(std::string_view path, const DecodeParams& params) override {
    drwav wav{};
    if (!drwav_init_file(&wav, std::string(path).c_str(), nullptr))
      return tl::unexpected(ErrorCode::DecodeError);

    Expected<DecodedAudio> res = decode_impl(wav, params);
    drwav_uninit(&wav);
    return res;
  }

  Expected<DecodedAudio> decode_bytes(std::span<const std::byte> data, const DecodeParams& params) override {
    drwav wav{};
    if (!drwav_init_memory(&wav, data.data(), data.size(), nullptr))
      return tl::unexpected(ErrorCode::DecodeError);

    Expected<DecodedAudio> res = decode_impl(wav, params);
    drwav_uninit(&wav);
    return res;
  }

private:
  Expected<DecodedAudio> decode_impl(drwav& wav, const DecodeParams& params) {
    const uint32_t channels = wav.channels;
    const uint32_t sr       = wav.sampleRate;
    if (channels == 0 || sr == 0) return tl::unexpected(ErrorCode::DecodeError);

    const std::uint64_t max_frames = max_frames_for(params, sr);
    bool truncated = false;
    kfr::univector<float> interleaved;
    const drwav_uint64 total_frames = wav.totalPCMFrameCount;
    if (total_frames > 0) {
      drwav_uint64 want = total_frames;
      if (max_frames > 0 && want > max_frames) {
        want = max_frames;
        truncated = true;
      }
      interleaved.resize(static_cast<size_t>(want) * channels);
      drwav_uint64 read = drwav_read_pcm_frames_f32(&wav, want, interleaved.data());
      interleaved.resize(static_cast<size_t>(read) * channels);
    } else {
      // Some WAVs do not report a frame count; read in chunks.
      interleaved = read_chunked(
          [&wav](std::uint64_t n, float* dst) { return drwav_read_pcm_frames_f32(&wav, n, dst); },
          channels, max_frames, truncated);
    }

    return to_decoded(interleaved, channels, sr, truncated, *downmixer_);
  }

  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
// MP3 Decoder (dr_mp3)
// -------------------------------
//
// Supported:
//  - Container/codec: MPEG-1/2 Layer III (CBR/VBR)
//  - Channels: 1..2 typical (downmixed to mono)
//
// Thread-safety: instance NOT thread-safe.
//

class DrMp3Decoder final : public IAudioDecoder {
public:
  explicit DrMp3Decoder(std::unique_ptr<IDownmixer> dm)
    : downmixer_(std::move(dm)) {}

  Expected<DecodedAudio> decode_file(std::string_view path, const DecodeParams& params) override {
    drmp3 mp3{};
    if (!drmp3_init_file(&mp3, std::string(path).c_str(), nullptr))
      return tl::unexpected(ErrorCode::DecodeError);

    Expected<DecodedAudio> res = decode_impl(mp3, params);
    drmp3_uninit(&mp3);
    return res;
  }

  Expected<DecodedAudio> decode_bytes(std::span<const std::byte> data, const DecodeParams& params) override {
    drmp3 mp3{};
    if (!drmp3_init_memory(&mp3, data.data(), data.size(), nullptr))
      return tl::unexpected(ErrorCode::DecodeError);

    Expected<DecodedAudio> res = decode_impl(mp3, params);
    drmp3_uninit(&mp3);
    return res;
  }

private:
  Expected<DecodedAudio> decode_impl(drmp3& mp3, const DecodeParams& params) {
    const uint32_t channels = mp3.channels;
    const uint32_t sr       = mp3.sampleRate;
    if (channels == 0 || sr == 0) return tl::unexpected(ErrorCode::DecodeError);

    bool truncated = false;
    auto interleaved = read_chunked(
        [&mp3](std::uint64_t n, float* dst) { return drmp3_read_pcm_frames_f32(&mp3, n, dst); },
        channels, max_frames_for(params, sr), truncated);

    return to_decoded(interleaved, channels, sr, truncated, *downmixer_);
  }

  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
// FLAC Decoder (dr_flac)
// -------------------------------
//
// Supported:
//  - Container/codec: FLAC
//  - Bit depths: 16/24-bit typical
//  - Channels: 1..8 (downmixed to mono)
//
// Thread-safety: instance NOT thread-safe.
//

class DrFlacDecoder final : public IAudioDecoder {
public:
  explicit DrFlacDecoder(std::unique_ptr<IDownmixer> dm)
    : downmixer_(std::move(dm)) {}

  Expected<DecodedAudio> decode_file(std::string_view path, const DecodeParams& params) override {
    drflac* flac = drflac_open_file(std::string(path).c_str(), nullptr);
    if (!flac) return tl::unexpected(ErrorCode::DecodeError);
    Expected<DecodedAudio> res = decode_impl(*flac, params);
    drflac_close(flac);
    return res;
  }

  Expected<DecodedAudio> decode_bytes(std::span<const std::byte> data, const DecodeParams& params) override {
    drflac* flac = drflac_open_memory(data.data(), data.size(), nullptr);
    if (!flac) return tl::unexpected(ErrorCode::DecodeError);
    Expected<DecodedAudio> res = decode_impl(*flac, params);
    drflac_close(flac);
    return res;
  }

private:
  Expected<DecodedAudio> decode_impl(drflac& flac, const DecodeParams& params) {
    const uint32_t channels = flac.channels;
    const uint32_t sr       = flac.sampleRate;
    if (channels == 0 || sr == 0) return tl::unexpected(ErrorCode::DecodeError);

    // STREAMINFO may leave the total at 0 (unknown), so read until the stream ends.
    bool truncated = false;
    auto interleaved = read_chunked(
        [&flac](std::uint64_t n, float* dst) { return drflac_read_pcm_frames_f32(&flac, n, dst); },
        channels, max_frames_for(params, sr), truncated);

    return to_decoded(interleaved, channels, sr, truncated, *downmixer_);
  }

  std::unique_ptr<IDownmixer> downmixer_;
};

// -------------------------------
/* Composite decoder & Factory */
// -------------------------------

class CompositeDecoder final : public IAudioDecoder {
public:
  CompositeDecoder() {
    decoders_.reserve(3);
    // Each concrete decoder gets its own downmixer instance.
    decoders_.push_back(std::make_unique<DrWavDecoder>(std::make_unique<EnergyPreservingDownmixer>()));
    decoders_.push_back(std::make_unique<DrMp3Decoder>(std::make_unique<EnergyPreservingDownmixer>()));
    decoders_.push_back(std::make_unique<DrFlacDecoder>(std::make_unique<EnergyPreservingDownmixer>()));
  }

  Expected<DecodedAudio> decode_file(std::string_view path, const DecodeParams& params) override {
    // Try preferred decoder by extension; fallback to trial.
    const SniffedFormat ext = sniff_extension(path);
    if (ext != SniffedFormat::Unknown) {
      auto out = decoder_for(ext).decode_file(path, params);
      if (out || out.error() != ErrorCode::DecodeError) return out;
    }

    for (auto& d : decoders_) {
      if (auto out = d->decode_file(path, params)) return out;
    }
    return tl::unexpected(ErrorCode::DecodeError);
  }

  Expected<DecodedAudio> decode_bytes(std::span<const std::byte> data, const DecodeParams& params) override {
    // A recognised header is authoritative: an empty stream there is a FormatError, not a retry.
    const SniffedFormat fmt = sniff_header(data);
    if (fmt != SniffedFormat::Unknown) {
      auto out = decoder_for(fmt).decode_bytes(data, params);
      if (out || out.error() != ErrorCode::DecodeError) return out;
    }

    for (auto& d : decoders_) {
      if (auto out = d->decode_bytes(data, params)) return out;
    }
    return tl::unexpected(ErrorCode::DecodeError);
  }

private:
  IAudioDecoder& decoder_for(SniffedFormat kind) {
    switch (kind) {
      case SniffedFormat::Mp3:  return *decoders_[1];
      case SniffedFormat::Flac: return *decoders_[2];
      default: break;
    }
    return *decoders_[0];
  }

  std::vector<std::unique_ptr<IAudioDecoder>> decoders_;
};

class DefaultDecoderFactory final : public IDecoderFactory {
public:
  [[nodiscard]] std::unique_ptr<IAudioDecoder> create_decoder() const override {
    // Composite with internal WAV/MP3/FLAC decoders
    return std::make_unique<CompositeDecoder>();
  }
};

std::unique_ptr<IDecoderFactory> make_default_decoder_factory() {
  return std::make_unique<DefaultDecoderFactory>();
}

} // namespace aed::io
