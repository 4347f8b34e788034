#include <vinfer/vision/label_map.hpp>
#include <cctype>
#include <charconv>
#include <fstream>

namespace vinfer::vision {

namespace {

class NamesCursor {
 public:
  explicit NamesCursor(std::string_view text) : text_(text) {}

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  std::optional<std::int64_t> integer() {
    skip_ws();
    std::int64_t value = 0;
    const char* first = text_.data() + pos_;
    const char* last = text_.data() + text_.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr == first) return std::nullopt;
    pos_ += static_cast<std::size_t>(ptr - first);
    return value;
  }

  /// Single- or double-quoted string with backslash escapes.
  std::optional<std::string> quoted() {
    skip_ws();
    if (pos_ >= text_.size()) return std::nullopt;
    const char quote = text_[pos_];
    if (quote != '\'' && quote != '"') return std::nullopt;
    ++pos_;
    std::string out;
    while (pos_ < text_.size()) {
      const char c = text_[pos_++];
      if (c == '\\' && pos_ < text_.size()) {
        out.push_back(text_[pos_++]);
      } else if (c == quote) {
        return out;
      } else {
        out.push_back(c);
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] bool at_end() {
    skip_ws();
    return pos_ == text_.size();
  }

 private:
  std::string_view text_;
  std::size_t pos_{0};
};

}  // namespace

LabelMap::LabelMap(std::vector<std::string> names) {
  for (std::size_t i = 0; i < names.size(); ++i) {
    names_.emplace(static_cast<std::int64_t>(i), std::move(names[i]));
  }
}

LabelMap::LabelMap(std::unordered_map<std::int64_t, std::string> names)
    : names_(std::move(names)) {}

std::string LabelMap::label_for(std::int64_t class_id) const {
  auto it = names_.find(class_id);
  if (it == names_.end()) return std::to_string(class_id);
  return it->second;
}

std::optional<LabelMap> LabelMap::parse_names_metadata(std::string_view text) {
  NamesCursor cur(text);
  if (!cur.consume('{')) return std::nullopt;

  std::unordered_map<std::int64_t, std::string> names;
  if (cur.consume('}')) {
    return cur.at_end() ? std::optional<LabelMap>(LabelMap(std::move(names))) : std::nullopt;
  }
  while (true) {
    auto id = cur.integer();
    if (!id || !cur.consume(':')) return std::nullopt;
    auto name = cur.quoted();
    if (!name) return std::nullopt;
    names[*id] = std::move(*name);
    if (cur.consume(',')) {
      if (cur.consume('}')) break;  // trailing comma
      continue;
    }
    if (cur.consume('}')) break;
    return std::nullopt;
  }
  if (!cur.at_end()) return std::nullopt;
  return LabelMap(std::move(names));
}

std::optional<LabelMap> LabelMap::load_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;

  std::vector<std::string> names;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    names.push_back(line);
  }
  while (!names.empty() && names.back().empty()) names.pop_back();
  return LabelMap(std::move(names));
}

}  // namespace vinfer::vision
