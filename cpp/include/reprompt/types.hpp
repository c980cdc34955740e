/**
 * @file types.hpp
 * @brief Базовые типы и константы reprompt
 *
 * Общие для всего приложения коды результатов и значение буфера обмена.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace reprompt {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/reprompt/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/reprompt/config.yaml";

/// Версия для --version
inline constexpr std::string_view kVersion = "0.3.0";

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Результат операции с буфером обмена
enum class ClipboardResult {
  Ok,
  NoConnection,     // Backend недоступен (нет дисплея, нет утилиты)
  NoSelection,      // В буфере нет текстовых данных
  ConversionFailed, // Ошибка кодировки / конвертации
  Timeout,
  ProcessFailed // Вспомогательный процесс завершился с ошибкой
};

/// Человекочитаемое имя кода результата
[[nodiscard]] constexpr std::string_view
to_string(ClipboardResult result) noexcept {
  switch (result) {
  case ClipboardResult::Ok:
    return "ok";
  case ClipboardResult::NoConnection:
    return "backend unavailable";
  case ClipboardResult::NoSelection:
    return "no text in clipboard";
  case ClipboardResult::ConversionFailed:
    return "encoding error";
  case ClipboardResult::Timeout:
    return "timeout";
  case ClipboardResult::ProcessFailed:
    return "helper process failed";
  }
  return "unknown";
}

/// Тип backend'а буфера обмена
enum class BackendKind { Auto, X11, Wayland, Wsl };

// ===========================================================================
// Значение буфера обмена
// ===========================================================================

/**
 * @brief Неизменяемое значение буфера обмена с логическим номером чтения
 *
 * Два payload равны тогда и только тогда, когда их текст побайтово совпадает;
 * номер последовательности в сравнении не участвует.
 */
class ClipboardPayload {
public:
  ClipboardPayload() = default;
  ClipboardPayload(std::string text, std::uint64_t sequence)
      : text_{std::move(text)}, sequence_{sequence} {}

  [[nodiscard]] const std::string &text() const noexcept { return text_; }
  [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }

  bool operator==(const ClipboardPayload &other) const noexcept {
    return text_ == other.text_;
  }

private:
  std::string text_;
  std::uint64_t sequence_ = 0;
};

} // namespace reprompt
