#include "aed/persist/json.hpp"

#include <cmath>
#include <cstdio>

namespace aed::persist {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

// -----------------------------
// JsonWriter
// -----------------------------

void JsonWriter::newline() {
  out_.push_back('\n');
  out_.append(stack_.size() * 2, ' ');
}

void JsonWriter::before_value() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (stack_.empty()) return;
  if (!stack_.back().empty) out_.push_back(',');
  stack_.back().empty = false;
  newline();
}

JsonWriter& JsonWriter::begin_object() {
  before_value();
  out_.push_back('{');
  stack_.push_back(Level{false, true});
  return *this;
}

JsonWriter& JsonWriter::end_object() {
  const bool was_empty = stack_.back().empty;
  stack_.pop_back();
  if (!was_empty) newline();
  out_.push_back('}');
  return *this;
}

JsonWriter& JsonWriter::begin_array() {
  before_value();
  out_.push_back('[');
  stack_.push_back(Level{true, true});
  return *this;
}

JsonWriter& JsonWriter::end_array() {
  const bool was_empty = stack_.back().empty;
  stack_.pop_back();
  if (!was_empty) newline();
  out_.push_back(']');
  return *this;
}

JsonWriter& JsonWriter::key(std::string_view k) {
  before_value();
  out_.push_back('"');
  out_ += escape_json(k);
  out_ += "\": ";
  after_key_ = true;
  return *this;
}

JsonWriter& JsonWriter::value(std::string_view s) {
  before_value();
  out_.push_back('"');
  out_ += escape_json(s);
  out_.push_back('"');
  return *this;
}

JsonWriter& JsonWriter::value(bool b) {
  before_value();
  out_ += b ? "true" : "false";
  return *this;
}

JsonWriter& JsonWriter::value(std::int64_t v) {
  before_value();
  out_ += std::to_string(v);
  return *this;
}

JsonWriter& JsonWriter::value(std::uint64_t v) {
  before_value();
  out_ += std::to_string(v);
  return *this;
}

JsonWriter& JsonWriter::value(double v, int decimals) {
  if (!std::isfinite(v)) return null();
  before_value();
  char buf[64];
  if (decimals >= 0) {
    const double scale = std::pow(10.0, decimals);
    double r = std::round(v * scale) / scale;
    if (r == 0.0) r = 0.0; // no "-0"
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, r);
    std::string s(buf);
    if (s.find('.') != std::string::npos) {
      while (s.back() == '0') s.pop_back();
      if (s.back() == '.') s.push_back('0');
    }
    out_ += s;
  } else {
    std::snprintf(buf, sizeof(buf), "%.9g", v);
    out_ += buf;
  }
  return *this;
}

JsonWriter& JsonWriter::null() {
  before_value();
  out_ += "null";
  return *this;
}

// -----------------------------
// Shaped results
// -----------------------------

namespace {
constexpr int kDecimals = 2;

void write_label_prob(JsonWriter& w, const util::DetectionEvent& e) {
  w.begin_object();
  w.key("label").value(e.label);
  w.key("prob").value(double(e.probability), kDecimals);
  w.end_object();
}
} // namespace

void write_top_n(JsonWriter& w, const shape::TopN& t) {
  w.begin_array();
  for (const auto& e : t.ranked) {
    w.begin_object();
    w.key("label").value(e.label);
    w.key("score").value(double(e.probability), kDecimals);
    w.end_object();
  }
  w.end_array();
}

void write_timeline_members(JsonWriter& w, const shape::Timeline& t) {
  w.key("timeline").begin_array();
  for (const auto& ev : t.events) {
    w.begin_object();
    w.key("start").value(ev.start_s, kDecimals);
    w.key("end").value(ev.end_s, kDecimals);
    w.key("label").value(ev.event.label);
    w.key("prob").value(double(ev.event.probability), kDecimals);
    w.end_object();
  }
  w.end_array();

  w.key("slot_timeline").begin_array();
  for (const auto& fr : t.frames) {
    w.begin_object();
    w.key("time").value(fr.start_s, kDecimals);
    w.key("events").begin_array();
    for (const auto& e : fr.events) write_label_prob(w, e);
    w.end_array();
    w.end_object();
  }
  w.end_array();
}

void write_summary(JsonWriter& w, const shape::SegmentSummary& s) {
  w.begin_array();
  for (const auto& seg : s.segments) {
    w.begin_object();
    w.key("start").value(seg.start_s, kDecimals);
    w.key("end").value(seg.end_s, kDecimals);
    w.key("labels").begin_array();
    for (const auto& l : seg.labels) w.value(l);
    w.end_array();
    w.end_object();
  }
  w.end_array();
}

std::string top_n_json(const shape::TopN& t) {
  JsonWriter w;
  w.begin_object();
  w.key("top_n");
  write_top_n(w, t);
  w.end_object();
  return w.str();
}

std::string timeline_json(const shape::Timeline& t) {
  JsonWriter w;
  w.begin_object();
  write_timeline_members(w, t);
  w.end_object();
  return w.str();
}

std::string summary_json(const shape::SegmentSummary& s) {
  JsonWriter w;
  w.begin_object();
  w.key("summary");
  write_summary(w, s);
  w.end_object();
  return w.str();
}

std::string artifact_json(std::string_view slot, const shape::ShapedBundle& b, bool truncated) {
  JsonWriter w;
  w.begin_object();
  w.key("slot").value(slot);
  write_timeline_members(w, b.timeline);
  w.key("top_n");
  write_top_n(w, b.top);
  w.key("summary");
  write_summary(w, b.summary);
  w.key("truncated").value(truncated);
  w.end_object();
  return w.str();
}
} // namespace aed::persist
