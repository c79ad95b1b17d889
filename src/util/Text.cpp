#include "util/Text.hpp"

namespace procstat::util {

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return sv;
}

std::string ascii_lower(std::string_view sv) {
  std::string out(sv);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

std::string sanitize_printable(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    out.push_back((c >= 0x20 && c <= 0x7E) ? ch : '?');
  }
  return std::string(trim(out));
}

std::string truncate_display(std::string text, size_t max_width) {
  if (text.size() <= max_width) return text;
  if (max_width <= 3) return std::string(max_width, '.');
  text.resize(max_width - 3);
  text += "...";
  return text;
}

} // namespace procstat::util
