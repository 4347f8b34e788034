#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vinfer::vision {

/// Class id -> label. Ids without a name render as their decimal value.
class LabelMap {
 public:
  LabelMap() = default;
  explicit LabelMap(std::vector<std::string> names);
  explicit LabelMap(std::unordered_map<std::int64_t, std::string> names);

  [[nodiscard]] std::string label_for(std::int64_t class_id) const;
  [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
  [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

  /// Parse the exporter's `names` metadata, e.g. "{0: 'cat', 1: 'dog'}".
  /// Returns nullopt if the text is not a dictionary of int -> quoted string.
  [[nodiscard]] static std::optional<LabelMap> parse_names_metadata(std::string_view text);

  /// Load one label per line (line index = class id). Returns nullopt if unreadable.
  [[nodiscard]] static std::optional<LabelMap> load_file(const std::string& path);

 private:
  std::unordered_map<std::int64_t, std::string> names_;
};

}  // namespace vinfer::vision
