#include "strata/text.hpp"

namespace strata::text {

auto decode_utf8(std::span<const std::uint8_t> bytes) -> std::optional<Text> {
  Text out;
  out.reserve(bytes.size());
  std::size_t i = 0;
  const std::size_t n = bytes.size();
  while (i < n) {
    const std::uint8_t lead = bytes[i];
    if (lead < 0x80) {
      out.push_back(lead);
      ++i;
      continue;
    }
    std::size_t len;
    char32_t cp;
    char32_t min;
    if ((lead & 0xE0) == 0xC0) {
      len = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4; cp = lead & 0x07; min = 0x10000;
    } else {
      return std::nullopt;
    }
    if (i + len > n) {
      return std::nullopt;
    }
    for (std::size_t j = 1; j < len; ++j) {
      const std::uint8_t c = bytes[i + j];
      if ((c & 0xC0) != 0x80) {
        return std::nullopt;
      }
      cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return std::nullopt;
    }
    out.push_back(cp);
    i += len;
  }
  return out;
}

auto encode_utf8(std::u32string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (const char32_t cp : text) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

auto classify(std::span<const std::uint8_t> bytes) -> ContentKind {
  return decode_utf8(bytes) ? ContentKind::Text : ContentKind::Binary;
}

auto kind_letter(ContentKind kind) -> char {
  switch (kind) {
  case ContentKind::Text:
    return 't';
  case ContentKind::Binary:
    return 'b';
  }
  return '?';
}

} // namespace strata::text
