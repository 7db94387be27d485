#include "aed/batch/units.hpp"

#include <cstdio>
#include <utility>

namespace aed::batch {
using aed::util::ErrorCode;
using aed::util::Expected;

namespace {

bool digits(std::string_view s, std::size_t pos, std::size_t n, int& out) noexcept {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

bool leap(int y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  for (;;) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace

bool is_valid_device_id(std::string_view id) noexcept {
  if (id.empty() || id == "." || id == "..") return false;
  return id.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

bool is_valid_date(std::string_view d) noexcept {
  if (d.size() != 10 || d[4] != '-' || d[7] != '-') return false;
  int y = 0, m = 0, day = 0;
  if (!digits(d, 0, 4, y) || !digits(d, 5, 2, m) || !digits(d, 8, 2, day)) return false;
  if (y < 1 || m < 1 || m > 12 || day < 1) return false;
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const int max_day = (m == 2 && leap(y)) ? 29 : kDays[m - 1];
  return day <= max_day;
}

bool is_valid_slot(std::string_view s) noexcept {
  if (s.size() != 5 || s[2] != '-') return false;
  int h = 0, m = 0;
  if (!digits(s, 0, 2, h) || !digits(s, 3, 2, m)) return false;
  return h < 24 && m < 60;
}

std::optional<UnitMetadata> parse_unit_key(std::string_view key) {
  const auto parts = split(key, '/');
  if (parts.size() != 4) return std::nullopt;
  if (!is_valid_device_id(parts[0]) || !is_valid_date(parts[1]) || !is_valid_slot(parts[2]) ||
      parts[3] != kSlotAudioName)
    return std::nullopt;
  return UnitMetadata{std::string(parts[0]), std::string(parts[1]), std::string(parts[2])};
}

AudioUnit make_unit(std::string key) {
  AudioUnit u;
  u.meta = parse_unit_key(key);
  u.key = std::move(key);
  return u;
}

Expected<std::vector<std::string>> time_slot_grid(unsigned minutes) {
  constexpr unsigned kDay = 24 * 60;
  if (minutes == 0 || kDay % minutes != 0) return tl::unexpected(ErrorCode::InvalidArgument);
  std::vector<std::string> slots;
  slots.reserve(kDay / minutes);
  for (unsigned t = 0; t < kDay; t += minutes) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u-%02u", t / 60, t % 60);
    slots.emplace_back(buf);
  }
  return slots;
}

std::string slot_key(std::string_view device_id, std::string_view date, std::string_view slot) {
  std::string k;
  k.reserve(device_id.size() + date.size() + slot.size() + kSlotAudioName.size() + 3);
  k.append(device_id).append("/").append(date).append("/").append(slot).append("/");
  k.append(kSlotAudioName);
  return k;
}

Expected<std::vector<AudioUnit>> expand_device_day(std::string_view device_id,
                                                   std::string_view date,
                                                   unsigned slot_minutes) {
  if (!is_valid_device_id(device_id))
    return tl::unexpected(ErrorCode::InvalidArgument);
  if (!is_valid_date(date)) return tl::unexpected(ErrorCode::InvalidArgument);

  auto slots = time_slot_grid(slot_minutes);
  if (!slots) return tl::unexpected(slots.error());

  std::vector<AudioUnit> units;
  units.reserve(slots->size());
  for (auto& s : *slots) {
    AudioUnit u;
    u.key = slot_key(device_id, date, s);
    u.meta = UnitMetadata{std::string(device_id), std::string(date), std::move(s)};
    units.push_back(std::move(u));
  }
  return units;
}
} // namespace aed::batch
