#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aed/util/util.hpp"

namespace aed::batch {
/** Device/time-window facts parsed from a grid key. */
struct UnitMetadata {
  std::string device_id;
  std::string date; ///< YYYY-MM-DD
  std::string slot; ///< HH-MM
};

/**
 * One recording to process. The key is opaque to everything but the source.
 * payload may be pre-filled (e.g. uploaded bytes); otherwise it is fetched.
 */
struct AudioUnit {
  std::string key;
  std::optional<UnitMetadata> meta;
  std::optional<std::vector<std::byte>> payload;
};

/** Name of the audio object inside each slot directory. */
inline constexpr std::string_view kSlotAudioName = "audio.wav";

/**
 * Parse `<device>/<YYYY-MM-DD>/<HH-MM>/audio.wav`.
 * Returns nullopt for any other shape, including a device component that
 * fails is_valid_device_id (the key is then treated as opaque).
 */
std::optional<UnitMetadata> parse_unit_key(std::string_view key);

/** AudioUnit for key with metadata parsed when the key has the grid shape. */
AudioUnit make_unit(std::string key);

/**
 * True when id can name one path component: non-empty, not "." or "..",
 * and free of '/', '\\' and NUL.
 */
bool is_valid_device_id(std::string_view id) noexcept;

/** True for a real calendar date written as YYYY-MM-DD. */
bool is_valid_date(std::string_view date) noexcept;

/** True for HH-MM with HH < 24 and MM < 60. */
bool is_valid_slot(std::string_view slot) noexcept;

/**
 * Slots of one day, `HH-MM`, every `minutes` starting at 00-00.
 * 30 gives the 48 half-hour slots. minutes must divide 1440, else InvalidArgument.
 */
util::Expected<std::vector<std::string>> time_slot_grid(unsigned minutes = 30);

/** `<device>/<date>/<slot>/audio.wav` */
std::string slot_key(std::string_view device_id, std::string_view date, std::string_view slot);

/**
 * Purpose: Expand a device+date request into one unit per grid slot.
 * Postconditions:
 *  - units in slot order, each with metadata set
 *  - InvalidArgument when is_valid_device_id(device_id) is false
 *    or the date is malformed
 */
util::Expected<std::vector<AudioUnit>> expand_device_day(std::string_view device_id,
                                                         std::string_view date,
                                                         unsigned slot_minutes = 30);
} // namespace aed::batch
