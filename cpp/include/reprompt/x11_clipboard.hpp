/**
 * @file x11_clipboard.hpp
 * @brief Нативный backend буфера обмена X11
 *
 * Чтение — прямое взаимодействие с CLIPBOARD selection.
 * Запись — через xclip/xsel: однократный процесс не может владеть selection
 * после выхода, а утилиты продолжают обслуживать его в фоне.
 */

#pragma once

#include <X11/Xlib.h>

#include <chrono>
#include <string>
#include <string_view>

#include "reprompt/clipboard_port.hpp"
#include "reprompt/types.hpp"

namespace reprompt {

/**
 * @brief Backend X11
 *
 * Использует RAII для управления X11 ресурсами.
 */
class X11Clipboard final : public ClipboardPort {
public:
  /**
   * @brief Конструктор
   * @param timeout Таймаут ожидания selection и вспомогательных утилит
   */
  explicit X11Clipboard(
      std::chrono::milliseconds timeout = std::chrono::milliseconds{3000});

  ~X11Clipboard() override;

  // Запрет копирования (X11 ресурсы)
  X11Clipboard(const X11Clipboard &) = delete;
  X11Clipboard &operator=(const X11Clipboard &) = delete;

  /**
   * @brief Открывает соединение с X сервером
   * @return true если соединение установлено
   */
  bool open();

  /**
   * @brief Закрывает соединение
   */
  void close();

  [[nodiscard]] ClipboardRead read() override;

  [[nodiscard]] ClipboardResult write(std::string_view text) override;

  [[nodiscard]] std::string_view name() const noexcept override {
    return "x11";
  }

private:
  /**
   * @brief Ожидание SelectionNotify события
   * @return Ok, Timeout или ConversionFailed (владелец отказал)
   */
  ClipboardResult wait_for_selection_notify();

  std::chrono::milliseconds timeout_;

  Display *display_ = nullptr;
  Window window_ = None;

  // X11 атомы (кэшируются после открытия)
  Atom atom_clipboard_ = None;
  Atom atom_utf8_string_ = None;
  Atom atom_incr_ = None;
  Atom atom_property_ = None;
};

} // namespace reprompt
