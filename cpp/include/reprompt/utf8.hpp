/**
 * @file utf8.hpp
 * @brief UTF-8 утилиты и классификация символов псевдографики
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace reprompt {

/// Символ замены для невалидных последовательностей
inline constexpr char32_t kReplacementChar = 0xFFFD;

/**
 * @brief Определяет длину UTF-8 символа по первому байту
 * @param first_byte Первый байт UTF-8 последовательности
 * @return Длина в байтах (1-4), или 0 для невалидного байта
 */
[[nodiscard]] constexpr std::size_t
utf8_char_len(unsigned char first_byte) noexcept {
  if ((first_byte & 0x80) == 0)
    return 1; // ASCII
  if ((first_byte & 0xE0) == 0xC0)
    return 2; // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0)
    return 4; // 11110xxx
  return 0;   // Invalid
}

/**
 * @brief Строго декодирует один символ UTF-8
 * @param text Исходная строка
 * @param pos Позиция первого байта; при успехе сдвигается за символ
 * @return Кодовая точка или nullopt (overlong, суррогаты, обрыв)
 */
[[nodiscard]] std::optional<char32_t> decode_utf8(std::string_view text,
                                                  std::size_t &pos) noexcept;

/**
 * @brief Декодирует символ, заменяя невалидный байт на U+FFFD
 *
 * Всегда продвигает @p pos хотя бы на один байт.
 */
[[nodiscard]] char32_t decode_utf8_lossy(std::string_view text,
                                         std::size_t &pos) noexcept;

/// Дописывает кодовую точку в UTF-8
void append_utf8(std::string &out, char32_t cp);

/// Проверяет, что вся строка — валидный UTF-8
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

// ===========================================================================
// Псевдографика (Box Drawing, U+2500 - U+257F)
// ===========================================================================

/// Символ из блока Box Drawing
[[nodiscard]] constexpr bool is_box_drawing(char32_t cp) noexcept {
  return cp >= 0x2500 && cp <= 0x257F;
}

/**
 * @brief Вертикальная рамка, допустимая как боковая граница строки
 *
 * Одинарная, жирная и двойная линии: │ ┃ ║
 */
[[nodiscard]] constexpr bool is_vertical_border(char32_t cp) noexcept {
  return cp == 0x2502 || cp == 0x2503 || cp == 0x2551;
}

/**
 * @brief Чисто вертикальные глифы блока (без горизонтальной составляющей)
 *
 * Строка только из таких символов — это пустая строка внутри рамки, а не
 * горизонтальная линия.
 */
[[nodiscard]] constexpr bool is_vertical_only(char32_t cp) noexcept {
  switch (cp) {
  case 0x2502: // │
  case 0x2503: // ┃
  case 0x2506: // ┆
  case 0x2507: // ┇
  case 0x250A: // ┊
  case 0x250B: // ┋
  case 0x2551: // ║
  case 0x254E: // ╎
  case 0x254F: // ╏
  case 0x2575: // ╵
  case 0x2577: // ╷
  case 0x2579: // ╹
  case 0x257B: // ╻
  case 0x257D: // ╽
  case 0x257F: // ╿
    return true;
  default:
    return false;
  }
}

/// Пробельный символ (ASCII + NBSP)
[[nodiscard]] constexpr bool is_space(char32_t cp) noexcept {
  return cp == ' ' || cp == '\t' || cp == '\v' || cp == '\f' || cp == '\r' ||
         cp == 0x00A0;
}

/// Подсчитывает символы псевдографики в тексте
[[nodiscard]] std::size_t count_box_drawing(std::string_view text) noexcept;

} // namespace reprompt
