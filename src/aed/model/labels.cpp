#include "aed/model/labels.hpp"

#include <charconv>
#include <system_error>
#include <fstream>
#include <iterator>
#include <memory>
#include <utility>

namespace aed::model {
using aed::util::ErrorCode;
using aed::util::Expected;

namespace {

// Split one CSV record starting at `pos`; advances pos past the line break.
// Returns false on an unterminated quoted field.
bool next_record(std::string_view text, std::size_t& pos, std::vector<std::string>& fields) {
  fields.clear();
  std::string cur;
  bool quoted = false;
  while (pos < text.size()) {
    const char c = text[pos++];
    if (quoted) {
      if (c == '"') {
        if (pos < text.size() && text[pos] == '"') {
          cur.push_back('"');
          ++pos;
        } else {
          quoted = false;
        }
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(cur));
      cur.clear();
    } else if (c == '\n') {
      break;
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (quoted) return false;
  fields.push_back(std::move(cur));
  return true;
}

bool blank(const std::vector<std::string>& fields) {
  return fields.size() == 1 && fields[0].empty();
}

} // namespace

Expected<LabelSet> LabelSet::from_csv(std::string_view text, std::size_t expected_count) {
  std::vector<std::string> fields;
  std::size_t pos = 0;

  if (!next_record(text, pos, fields) || fields.size() < 3 || fields[0] != "index")
    return tl::unexpected(ErrorCode::InvalidArgument);

  std::vector<std::string> names;
  names.reserve(expected_count ? expected_count : kYamnetLabelCount);
  while (pos < text.size()) {
    if (!next_record(text, pos, fields)) return tl::unexpected(ErrorCode::InvalidArgument);
    if (blank(fields)) continue;
    if (fields.size() < 3) return tl::unexpected(ErrorCode::InvalidArgument);

    std::size_t idx = 0;
    const auto& f = fields[0];
    auto [end, ec] = std::from_chars(f.data(), f.data() + f.size(), idx);
    if (ec != std::errc{} || end != f.data() + f.size() || idx != names.size())
      return tl::unexpected(ErrorCode::InvalidArgument);

    names.push_back(std::move(fields[2]));
  }

  if (names.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
  if (expected_count != 0 && names.size() != expected_count)
    return tl::unexpected(ErrorCode::SizeMismatch);
  return from_names(std::move(names));
}

Expected<LabelSet> LabelSet::load_file(const std::filesystem::path& path,
                                       std::size_t expected_count) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return tl::unexpected(ErrorCode::IOError);
  std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return tl::unexpected(ErrorCode::IOError);
  return from_csv(text, expected_count);
}

LabelSet LabelSet::from_names(std::vector<std::string> names) {
  return LabelSet(std::make_shared<const std::vector<std::string>>(std::move(names)));
}

std::string_view LabelSet::name(std::size_t k) const noexcept {
  if (!names_ || k >= names_->size()) return {};
  return (*names_)[k];
}
} // namespace aed::model
