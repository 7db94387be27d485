#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "aed/util/util.hpp"

namespace aed::model {
/** Number of classes produced by YAMNet. */
inline constexpr std::size_t kYamnetLabelCount = 521;

/**
 * Ordered, immutable class names of one classifier.
 * Copies share the same name table.
 */
class LabelSet {
public:
  LabelSet() = default;

  /**
   * Purpose: Parse a class map in CSV form: header `index,mid,display_name`,
   *          then one row per class. Fields may be double-quoted; inside quotes
   *          commas are literal and `""` is an escaped quote.
   * Preconditions: none.
   * Postconditions:
   *  - Row k must carry index k, else InvalidArgument
   *  - expected_count > 0 and a different row count → SizeMismatch
   *  - No rows → InvalidArgument
   * Complexity: O(bytes).
   */
  static util::Expected<LabelSet> from_csv(std::string_view text,
                                           std::size_t expected_count = 0);

  /** Read `path` and parse it with from_csv. Unreadable file → IOError. */
  static util::Expected<LabelSet> load_file(const std::filesystem::path& path,
                                            std::size_t expected_count = 0);

  /** Build directly from names (tests, alternative model exports). */
  static LabelSet from_names(std::vector<std::string> names);

  [[nodiscard]] std::size_t size() const noexcept { return names_ ? names_->size() : 0; }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  /** Name of class k; empty view when k is out of range. */
  [[nodiscard]] std::string_view name(std::size_t k) const noexcept;

  /** Shared name table, attached to every ProbabilityMatrix built with this set. */
  [[nodiscard]] const util::LabelNames& names() const noexcept { return names_; }

private:
  explicit LabelSet(util::LabelNames names) : names_(std::move(names)) {}

  util::LabelNames names_;
};
} // namespace aed::model
