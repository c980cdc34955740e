/**
 * @file command_clipboard.hpp
 * @brief Backend буфера обмена через внешние утилиты (stdin/stdout)
 *
 * Используется там, где нет прямого доступа к буферу: WSL (powershell.exe
 * на стороне Windows) и Wayland (wl-paste / wl-copy).
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "reprompt/clipboard_port.hpp"
#include "reprompt/subprocess.hpp"
#include "reprompt/types.hpp"

namespace reprompt {

/// Описание команд чтения и записи
struct CommandSpec {
  std::string name;
  std::vector<std::string> read_argv;
  std::vector<std::string> write_argv;

  /// Приводить \r\n к \n при чтении
  bool normalize_crlf = false;
};

/// Команды для WSL: буфер Windows через powershell.exe
[[nodiscard]] CommandSpec wsl_command_spec();

/// Команды для Wayland: wl-paste / wl-copy
[[nodiscard]] CommandSpec wayland_command_spec();

/// Отображает результат процесса в код операции с буфером
[[nodiscard]] ClipboardResult
to_clipboard_result(const SubprocessResult &result) noexcept;

/// Заменяет все \r\n на \n
[[nodiscard]] std::string normalize_line_endings(std::string_view text);

/**
 * @brief Backend поверх внешних команд
 */
class CommandClipboard final : public ClipboardPort {
public:
  CommandClipboard(CommandSpec spec, std::chrono::milliseconds timeout);

  [[nodiscard]] ClipboardRead read() override;

  [[nodiscard]] ClipboardResult write(std::string_view text) override;

  [[nodiscard]] std::string_view name() const noexcept override {
    return spec_.name;
  }

private:
  CommandSpec spec_;
  std::chrono::milliseconds timeout_;
};

} // namespace reprompt
