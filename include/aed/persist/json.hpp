#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "aed/shape/shape.hpp"

namespace aed::persist {
/** JSON string body for s (no surrounding quotes); control characters as \uXXXX. */
std::string escape_json(std::string_view s);

/**
 * Streaming JSON writer with two-space indentation.
 * The caller is responsible for balanced begin/end calls; key() is only
 * valid directly inside an object.
 */
class JsonWriter {
public:
  JsonWriter& begin_object();
  JsonWriter& end_object();
  JsonWriter& begin_array();
  JsonWriter& end_array();
  JsonWriter& key(std::string_view k);

  JsonWriter& value(std::string_view s);
  JsonWriter& value(const char* s) { return value(std::string_view(s)); }
  JsonWriter& value(bool b);
  JsonWriter& value(std::int64_t v);
  JsonWriter& value(std::uint64_t v);
  JsonWriter& value(int v) { return value(static_cast<std::int64_t>(v)); }
  JsonWriter& value(unsigned v) { return value(static_cast<std::uint64_t>(v)); }
  /** decimals >= 0 rounds and drops trailing zeros (0.50 → 0.5); non-finite → null. */
  JsonWriter& value(double v, int decimals = -1);
  JsonWriter& null();

  [[nodiscard]] const std::string& str() const noexcept { return out_; }

private:
  void before_value();
  void newline();

  struct Level {
    bool array{false};
    bool empty{true};
  };
  std::string out_;
  std::vector<Level> stack_;
  bool after_key_{false};
};

// -----------------------------
// Shaped results
// -----------------------------
// Probabilities and times are written with 2 decimals.

void write_top_n(JsonWriter& w, const shape::TopN& t);

/** Writes the "timeline" and "slot_timeline" members into the open object. */
void write_timeline_members(JsonWriter& w, const shape::Timeline& t);

void write_summary(JsonWriter& w, const shape::SegmentSummary& s);

/** {"top_n": [...]} */
std::string top_n_json(const shape::TopN& t);
/** {"timeline": [...], "slot_timeline": [...]} */
std::string timeline_json(const shape::Timeline& t);
/** {"summary": [...]} */
std::string summary_json(const shape::SegmentSummary& s);

/** Per-unit artifact: slot, timeline, slot_timeline, top_n, summary, truncated. */
std::string artifact_json(std::string_view slot, const shape::ShapedBundle& b, bool truncated);
} // namespace aed::persist
