#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aed/batch/units.hpp"
#include "aed/shape/shape.hpp"
#include "aed/store/store.hpp"
#include "aed/util/util.hpp"

namespace aed::persist {
//==============================
// Remote artifact upload
//==============================

class IArtifactUploader {
public:
  virtual ~IArtifactUploader() = default;

  /**
   * Purpose: Publish the local file under remote_key.
   * Postconditions: Timeout / IOError / Unavailable on failure; never partial
   *                 at remote_key.
   */
  virtual util::Expected<void> upload(std::string_view remote_key,
                                      const std::filesystem::path& local_file,
                                      std::chrono::milliseconds timeout) = 0;
};

/** Uploader that copies into root/remote_key (temp file + rename). */
std::unique_ptr<IArtifactUploader> make_directory_uploader(std::filesystem::path root);

//==============================
// Adapter
//==============================

/**
 * Sink configuration.
 *  - artifact_root: local JSON artifacts; empty disables the sink (and upload)
 *  - status_flag: completion flag set on the unit's status record
 *  - timeout: per sink call
 */
struct PersistOptions {
  std::filesystem::path artifact_root;
  std::string status_flag{"sed_status"};
  std::chrono::milliseconds timeout{10000};
};

enum class Sink : std::uint8_t { LocalArtifact, ResultStore, Upload, Status };

std::string_view sink_name(Sink s) noexcept;

struct SinkResult {
  Sink sink{};
  bool ok{false};
  util::ErrorCode error{util::ErrorCode::None};
};

/**
 * Outcome of one persist() call. Only attempted sinks appear in `sinks`.
 * primary_ok reports the status sink; a missing status record still counts
 * as success (record_missing is set and a warning logged).
 */
struct PersistOutcome {
  std::vector<SinkResult> sinks;
  bool primary_ok{false};
  bool record_missing{false};
  util::ErrorCode primary_error{util::ErrorCode::None};
  std::optional<std::filesystem::path> artifact_path;

  [[nodiscard]] bool ok(Sink s) const noexcept;
};

/**
 * `<device>/<date>/sed/<slot>.json` for grid units. Other keys become one file
 * name, `<key>.json`, with '%', '/' and '\\' written as %25, %2F and %5C.
 */
std::string artifact_relpath(const batch::AudioUnit& unit);

/** Slot label for the artifact: the slot for grid units, else the key. */
std::string artifact_slot(const batch::AudioUnit& unit);

/**
 * Writes shaped results to every configured sink, status update last.
 * Collaborators other than the status store are optional (nullptr disables).
 * Thread-safety: as thread-safe as the collaborators; the adapter holds no
 * mutable state of its own.
 */
class PersistenceAdapter {
public:
  PersistenceAdapter(PersistOptions opts,
                     std::shared_ptr<store::IStatusStore> status,
                     std::shared_ptr<store::IResultStore> results = nullptr,
                     std::shared_ptr<IArtifactUploader> uploader = nullptr);

  /**
   * Purpose: Record the shaped output of one unit.
   * Order: local artifact → result store → upload → status.
   * Postconditions: non-primary failures are logged and reported in the
   *                 outcome; they never change primary_ok.
   */
  [[nodiscard]] PersistOutcome persist(const batch::AudioUnit& unit,
                                       const shape::ShapedBundle& shaped,
                                       bool truncated);

  /**
   * Purpose: Write processing_summary.json for a device+date run next to the
   *          slot artifacts: device, date, processed/available slot counts,
   *          processed slot names, UTC timestamp.
   * Postconditions: Unavailable when no artifact_root is configured;
   *   InvalidArgument for a device id that is not a single path component
   *   or a malformed date.
   */
  util::Expected<std::filesystem::path>
  write_batch_summary(std::string_view device_id, std::string_view date,
                      std::size_t available_slots,
                      const std::vector<std::string>& processed_slots);

  [[nodiscard]] const PersistOptions& options() const noexcept { return opts_; }

private:
  PersistOptions opts_;
  std::shared_ptr<store::IStatusStore> status_;
  std::shared_ptr<store::IResultStore> results_;
  std::shared_ptr<IArtifactUploader> uploader_;
};

/** Atomically replace path with contents (temp sibling + rename), creating parents. */
util::Expected<void> write_file_atomic(const std::filesystem::path& path, std::string_view contents);

/** Current UTC time as YYYY-MM-DDTHH:MM:SSZ. */
std::string utc_timestamp();
} // namespace aed::persist
