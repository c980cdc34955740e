/**
 * @file utf8.cpp
 * @brief Реализация UTF-8 утилит
 */

#include "reprompt/utf8.hpp"

namespace reprompt {

namespace {

[[nodiscard]] constexpr bool is_continuation(unsigned char b) noexcept {
  return (b & 0xC0) == 0x80;
}

} // namespace

std::optional<char32_t> decode_utf8(std::string_view text,
                                    std::size_t &pos) noexcept {
  if (pos >= text.size()) {
    return std::nullopt;
  }

  auto b0 = static_cast<unsigned char>(text[pos]);
  std::size_t len = utf8_char_len(b0);
  if (len == 0 || pos + len > text.size()) {
    return std::nullopt;
  }

  char32_t cp = 0;
  switch (len) {
  case 1:
    cp = b0;
    break;
  case 2:
    cp = b0 & 0x1F;
    break;
  case 3:
    cp = b0 & 0x0F;
    break;
  default:
    cp = b0 & 0x07;
    break;
  }

  for (std::size_t i = 1; i < len; ++i) {
    auto b = static_cast<unsigned char>(text[pos + i]);
    if (!is_continuation(b)) {
      return std::nullopt;
    }
    cp = (cp << 6) | (b & 0x3F);
  }

  // Overlong-кодировки, суррогаты и выход за U+10FFFF
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
      (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
      (cp >= 0xD800 && cp <= 0xDFFF)) {
    return std::nullopt;
  }

  pos += len;
  return cp;
}

char32_t decode_utf8_lossy(std::string_view text, std::size_t &pos) noexcept {
  if (auto cp = decode_utf8(text, pos)) {
    return *cp;
  }
  ++pos;
  return kReplacementChar;
}

void append_utf8(std::string &out, char32_t cp) {
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

bool is_valid_utf8(std::string_view text) noexcept {
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!decode_utf8(text, pos)) {
      return false;
    }
  }
  return true;
}

std::size_t count_box_drawing(std::string_view text) noexcept {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (is_box_drawing(decode_utf8_lossy(text, pos))) {
      ++count;
    }
  }
  return count;
}

} // namespace reprompt
