#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aed/util/util.hpp"

namespace aed::store {
//==============================
// Audio source (object store)
//==============================

struct FetchOptions {
  std::chrono::milliseconds timeout{30000};
};

/**
 * Read-only access to raw encoded audio by unit key.
 * Thread-safety: implementations below are safe for concurrent fetch().
 */
class IAudioSource {
public:
  virtual ~IAudioSource() = default;

  /**
   * Purpose: Fetch the complete encoded payload of `key`.
   * Postconditions:
   *  - NotFound when the key does not exist (distinct from every other failure)
   *  - Timeout when opts.timeout elapsed before the payload was complete
   *  - IOError / Unavailable for transport or storage failures
   */
  virtual util::Expected<std::vector<std::byte>>
  fetch(std::string_view key, const FetchOptions& opts) = 0;
};

/**
 * Object store rooted at a directory: key "a/b/c.wav" maps to root/a/b/c.wav.
 * Keys that are absolute or contain ".." are rejected with InvalidArgument.
 */
std::unique_ptr<IAudioSource> make_directory_audio_source(std::filesystem::path root);

/** In-process object store (tests, preloaded payloads). */
class MemoryAudioSource final : public IAudioSource {
public:
  void put(std::string key, std::vector<std::byte> bytes);
  void erase(std::string_view key);

  util::Expected<std::vector<std::byte>>
  fetch(std::string_view key, const FetchOptions& opts) override;

private:
  std::mutex mu_;
  std::map<std::string, std::vector<std::byte>, std::less<>> objects_;
};

//==============================
// Status records
//==============================

enum class StatusUpdate { Updated, NoMatchingRecord };

/**
 * Per-unit records holding named completion flags (e.g. sed_status=completed).
 */
class IStatusStore {
public:
  virtual ~IStatusStore() = default;

  /** Create an empty record for unit_id; existing records are left untouched. */
  virtual util::Expected<void> register_unit(std::string_view unit_id) = 0;

  /**
   * Purpose: Set flag := "completed" on the record of unit_id.
   * Postconditions:
   *  - NoMatchingRecord (success value) when no record exists; nothing written
   *  - Timeout when the deadline passed before the update committed
   */
  virtual util::Expected<StatusUpdate>
  mark_completed(std::string_view unit_id, std::string_view flag,
                 std::chrono::milliseconds timeout) = 0;

  /** Current flag value; nullopt when the record or the flag is absent. */
  virtual util::Expected<std::optional<std::string>>
  flag_value(std::string_view unit_id, std::string_view flag) = 0;
};

/** Value written by mark_completed. */
inline constexpr std::string_view kCompletedValue = "completed";

class MemoryStatusStore final : public IStatusStore {
public:
  util::Expected<void> register_unit(std::string_view unit_id) override;
  util::Expected<StatusUpdate> mark_completed(std::string_view unit_id, std::string_view flag,
                                              std::chrono::milliseconds timeout) override;
  util::Expected<std::optional<std::string>>
  flag_value(std::string_view unit_id, std::string_view flag) override;

private:
  std::mutex mu_;
  std::map<std::string, std::map<std::string, std::string>, std::less<>> records_;
};

//==============================
// Detection results
//==============================

/**
 * Label/probability collections keyed by (unit_id, window_key).
 * window_key is "top_n" for the whole-file ranking or "t=<start ms>" per frame.
 */
class IResultStore {
public:
  virtual ~IResultStore() = default;

  /** Replace the collection at (unit_id, window_key). */
  virtual util::Expected<void>
  put(std::string_view unit_id, std::string_view window_key,
      const std::vector<util::DetectionEvent>& events,
      std::chrono::milliseconds timeout) = 0;

  /** Stored collection; NotFound when absent. */
  virtual util::Expected<std::vector<util::DetectionEvent>>
  get(std::string_view unit_id, std::string_view window_key) = 0;

  /** Remove every collection of unit_id; returns how many were removed. */
  virtual util::Expected<std::size_t> erase_unit(std::string_view unit_id,
                                                 std::chrono::milliseconds timeout) = 0;
};

class MemoryResultStore final : public IResultStore {
public:
  util::Expected<void> put(std::string_view unit_id, std::string_view window_key,
                           const std::vector<util::DetectionEvent>& events,
                           std::chrono::milliseconds timeout) override;
  util::Expected<std::vector<util::DetectionEvent>>
  get(std::string_view unit_id, std::string_view window_key) override;
  util::Expected<std::size_t> erase_unit(std::string_view unit_id,
                                         std::chrono::milliseconds timeout) override;

  /** Number of stored collections. */
  std::size_t size();

private:
  std::mutex mu_;
  std::map<std::pair<std::string, std::string>, std::vector<util::DetectionEvent>> rows_;
};

//==============================
// LMDB-backed stores
//==============================

/**
 * LMDB environment/options.
 * Units:
 *  - map_size_bytes: bytes
 *
 * Thread-safety:
 *  - The environment is shared; LMDB supports multiple readers and one writer.
 */
struct LmdbOptions {
  std::size_t map_size_bytes{1ull << 30}; // 1 GiB default
  bool use_nosync{false};                 // MDB_NOSYNC (crash may lose last commits)
};

/** Opened LMDB environment with the "status" and "results" databases. */
class LmdbEnv;

/** Open (creating if needed) the environment directory at path. */
util::Expected<std::shared_ptr<LmdbEnv>> open_lmdb(const std::filesystem::path& path,
                                                   const LmdbOptions& opts = {});

std::unique_ptr<IStatusStore> make_lmdb_status_store(std::shared_ptr<LmdbEnv> env);
std::unique_ptr<IResultStore> make_lmdb_result_store(std::shared_ptr<LmdbEnv> env);
} // namespace aed::store
