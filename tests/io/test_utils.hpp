#pragma once
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <span>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

namespace testio {
  // --- deterministic RNG ---
  inline std::mt19937 &rng() {
    static std::mt19937 gen(12345u);
    return gen;
  }

  // --- sine/noise/silence generators ---
  inline std::vector<float> make_sine(float freq_hz, float sr, size_t frames, float amp = 0.5f) {
    std::vector<float> x(frames);
    const float w = 2.0f * float(M_PI) * (freq_hz / sr);
    for (size_t n = 0; n < frames; ++n) x[n] = amp * std::sin(w * float(n));
    return x;
  }

  inline std::vector<float> make_silence(size_t frames) { return std::vector<float>(frames, 0.0f); }

  inline std::vector<float> make_noise(size_t frames, float amp = 0.5f) {
    std::uniform_real_distribution<float> dist(-amp, amp);
    std::vector<float> x(frames);
    for (auto &v: x) v = dist(rng());
    return x;
  }

  // interleave planar channels into interleaved buffer
  inline std::vector<float> interleave(const std::vector<std::vector<float> > &ch) {
    if (ch.empty()) return {};
    const size_t C = ch.size();
    const size_t N = ch[0].size();
    std::vector<float> out(C * N);
    for (size_t n = 0; n < N; ++n)
      for (size_t c = 0; c < C; ++c)
        out[n * C + c] = ch[c][n];
    return out;
  }

  inline std::span<const std::byte> as_bytes(const std::vector<uint8_t> &v) {
    return {reinterpret_cast<const std::byte *>(v.data()), v.size()};
  }

  inline std::vector<std::byte> to_bytes(const std::vector<uint8_t> &v) {
    std::vector<std::byte> out(v.size());
    std::memcpy(out.data(), v.data(), v.size());
    return out;
  }

  // --- temp file / dir helpers ---
  inline std::filesystem::path unique_temp_path(const std::string &stem) {
    static std::atomic<uint64_t> counter{0};
    return std::filesystem::temp_directory_path() /
           (stem + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
  }

  class TempFile {
  public:
    explicit TempFile(std::string stem = "aed_test", std::string ext = ".bin")
      : path_(unique_temp_path(stem).string() + ext) {}

    ~TempFile() {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }

    const std::string &path() const { return path_; }

    void write(const void *data, size_t bytes) {
      std::ofstream ofs(path_, std::ios::binary | std::ios::trunc);
      ofs.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(bytes));
    }

  private:
    std::string path_;
  };

  class TempDir {
  public:
    explicit TempDir(std::string stem = "aed_dir") : path_(unique_temp_path(stem)) {
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path &path() const { return path_; }

  private:
    std::filesystem::path path_;
  };

  // --- tiny WAV writers (PCM16 / float32 interleaved) ---
#pragma pack(push, 1)
  struct RiffHeader {
    char riff[4];
    uint32_t size;
    char wave[4];
  };

  struct FmtChunk {
    char id[4];
    uint32_t size;
    uint16_t audio_fmt;
    uint16_t ch;
    uint32_t sr;
    uint32_t br;
    uint16_t ba;
    uint16_t bits;
  };

  struct DataChunk {
    char id[4];
    uint32_t size;
  };
#pragma pack(pop)

  inline std::vector<uint8_t> write_wav_f32(const std::vector<float> &interleaved, uint16_t ch, uint32_t sr) {
    const uint32_t frames = ch ? (uint32_t) (interleaved.size() / ch) : 0u;
    const uint32_t data_bytes = frames * ch * 4u;
    RiffHeader rh{
      {'R', 'I', 'F', 'F'}, 4 + 8 + static_cast<uint32_t>(sizeof(FmtChunk)) + 8 + data_bytes, {'W', 'A', 'V', 'E'}
    };
    FmtChunk fmt{{'f', 'm', 't', ' '}, 16, 3 /*IEEE float*/, ch, sr, sr * ch * 4u, (uint16_t) (ch * 4u), 32};
    DataChunk dc{{'d', 'a', 't', 'a'}, data_bytes};

    std::vector<uint8_t> out(sizeof(rh) + sizeof(fmt) + sizeof(dc) + data_bytes);
    uint8_t *p = out.data();
    std::memcpy(p, &rh, sizeof(rh));
    p += sizeof(rh);
    std::memcpy(p, &fmt, sizeof(fmt));
    p += sizeof(fmt);
    std::memcpy(p, &dc, sizeof(dc));
    p += sizeof(dc);
    if (data_bytes) std::memcpy(p, interleaved.data(), data_bytes);
    return out;
  }

  inline std::vector<uint8_t> write_wav_s16(const std::vector<float> &interleaved, uint16_t ch, uint32_t sr) {
    const uint32_t frames = ch ? (uint32_t) (interleaved.size() / ch) : 0u;
    const uint32_t data_bytes = frames * ch * 2u;
    RiffHeader rh{
      {'R', 'I', 'F', 'F'}, 4 + 8 + static_cast<uint32_t>(sizeof(FmtChunk)) + 8 + data_bytes, {'W', 'A', 'V', 'E'}
    };
    FmtChunk fmt{{'f', 'm', 't', ' '}, 16, 1 /*PCM*/, ch, sr, sr * ch * 2u, (uint16_t) (ch * 2u), 16};
    DataChunk dc{{'d', 'a', 't', 'a'}, data_bytes};

    std::vector<uint8_t> out(sizeof(rh) + sizeof(fmt) + sizeof(dc) + data_bytes);
    uint8_t *p = out.data();
    std::memcpy(p, &rh, sizeof(rh));
    p += sizeof(rh);
    std::memcpy(p, &fmt, sizeof(fmt));
    p += sizeof(fmt);
    std::memcpy(p, &dc, sizeof(dc));
    p += sizeof(dc);
    // convert float [-1,1] → int16
    for (size_t i = 0; i < frames * ch; ++i) {
      float v = std::clamp(interleaved[i], -1.0f, 1.0f);
      int16_t s = (int16_t) std::lrintf(v * 32767.0f);
      std::memcpy(p + i * 2, &s, 2);
    }
    return out;
  }

  // --- tiny FLAC writer (mono, 16-bit, 16 kHz, CONSTANT subframes) ---
  inline uint8_t flac_crc8(const uint8_t *p, size_t n) {
    uint8_t crc = 0;
    for (size_t i = 0; i < n; ++i) {
      crc ^= p[i];
      for (int b = 0; b < 8; ++b) crc = (crc & 0x80) ? uint8_t((crc << 1) ^ 0x07) : uint8_t(crc << 1);
    }
    return crc;
  }

  inline uint16_t flac_crc16(const uint8_t *p, size_t n) {
    uint16_t crc = 0;
    for (size_t i = 0; i < n; ++i) {
      crc ^= uint16_t(p[i] << 8);
      for (int b = 0; b < 8; ++b) crc = (crc & 0x8000) ? uint16_t((crc << 1) ^ 0x8005) : uint16_t(crc << 1);
    }
    return crc;
  }

  constexpr uint32_t kFlacBlock = 256;
  constexpr uint32_t kFlacRate = 16000;

  /**
   * One 256-sample frame per entry of `block_values`, each holding that value.
   * `streaminfo_total` is written as the total sample count; 0 means unknown.
   * Fewer than 128 blocks.
   */
  inline std::vector<uint8_t> write_flac_constant(const std::vector<int16_t> &block_values,
                                                  uint64_t streaminfo_total) {
    std::vector<uint8_t> out{'f', 'L', 'a', 'C', 0x80, 0x00, 0x00, 34};
    auto put_be = [&out](uint64_t v, int bytes) {
      for (int i = bytes - 1; i >= 0; --i) out.push_back(uint8_t(v >> (8 * i)));
    };
    put_be(kFlacBlock, 2); // min block
    put_be(kFlacBlock, 2); // max block
    put_be(0, 3);          // min frame size unknown
    put_be(0, 3);          // max frame size unknown
    // rate:20 | channels-1:3 | bits-1:5 | total:36
    put_be((uint64_t(kFlacRate) << 44) | (uint64_t(0) << 41) | (uint64_t(15) << 36) |
           (streaminfo_total & 0xFFFFFFFFFull), 8);
    out.insert(out.end(), 16, 0); // MD5 unset

    for (size_t f = 0; f < block_values.size(); ++f) {
      const size_t start = out.size();
      // sync + fixed blocking, 256 samples @ 16 kHz, mono 16-bit, frame number
      out.insert(out.end(), {0xFF, 0xF8, 0x85, 0x08, uint8_t(f)});
      out.push_back(flac_crc8(out.data() + start, out.size() - start));
      const auto v = uint16_t(block_values[f]);
      out.insert(out.end(), {0x00, uint8_t(v >> 8), uint8_t(v & 0xFF)});
      const uint16_t crc = flac_crc16(out.data() + start, out.size() - start);
      out.push_back(uint8_t(crc >> 8));
      out.push_back(uint8_t(crc & 0xFF));
    }
    return out;
  }

  /** Mono float32 WAV of `seconds` of a quiet sine. */
  inline std::vector<uint8_t> sine_wav(double seconds, uint32_t sr = 16000, float amp = 0.3f) {
    const auto n = static_cast<size_t>(std::llround(seconds * double(sr)));
    return write_wav_f32(make_sine(440.f, float(sr), n, amp), 1, sr);
  }
} // namespace testio
