/**
 * @file clipboard_port.hpp
 * @brief Абстрактный доступ к буферу обмена: read / write
 *
 * Конкретный backend (X11, Wayland, WSL) выбирается один раз при старте.
 */

#pragma once

#include <string>
#include <string_view>

#include "reprompt/types.hpp"

namespace reprompt {

/**
 * @brief Результат чтения буфера обмена
 *
 * При result != Ok поле text не используется, error содержит подробности.
 */
struct ClipboardRead {
  ClipboardResult result = ClipboardResult::Ok;
  std::string text;
  std::string error;

  [[nodiscard]] bool ok() const noexcept {
    return result == ClipboardResult::Ok;
  }
};

/**
 * @brief Интерфейс backend'а буфера обмена
 */
class ClipboardPort {
public:
  virtual ~ClipboardPort() = default;

  /// Текущее текстовое содержимое буфера
  [[nodiscard]] virtual ClipboardRead read() = 0;

  /// Перезаписывает буфер переданным текстом
  [[nodiscard]] virtual ClipboardResult write(std::string_view text) = 0;

  /// Имя backend'а для диагностики
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace reprompt
