/**
 * @file command_clipboard.cpp
 * @brief Реализация backend'а через внешние утилиты
 */

#include "reprompt/command_clipboard.hpp"
#include "reprompt/utf8.hpp"

#include <iostream>
#include <utility>

namespace reprompt {

namespace {

// UTF-8 без BOM в обе стороны, без завершающего перевода строки при чтении
inline constexpr const char *kPowershellRead =
    "[Console]::OutputEncoding = [System.Text.UTF8Encoding]::new($false); "
    "$t = Get-Clipboard -Raw; if ($t) { [Console]::Out.Write($t) }";

inline constexpr const char *kPowershellWrite =
    "[Console]::InputEncoding = [System.Text.UTF8Encoding]::new($false); "
    "Set-Clipboard -Value ([Console]::In.ReadToEnd())";

} // namespace

CommandSpec wsl_command_spec() {
  CommandSpec spec;
  spec.name = "wsl";
  spec.read_argv = {"powershell.exe", "-NoProfile", "-NonInteractive",
                    "-Command", kPowershellRead};
  spec.write_argv = {"powershell.exe", "-NoProfile", "-NonInteractive",
                     "-Command", kPowershellWrite};
  spec.normalize_crlf = true;
  return spec;
}

CommandSpec wayland_command_spec() {
  CommandSpec spec;
  spec.name = "wayland";
  spec.read_argv = {"wl-paste", "--no-newline", "--type", "text"};
  spec.write_argv = {"wl-copy", "--type", "text/plain;charset=utf-8"};
  return spec;
}

ClipboardResult to_clipboard_result(const SubprocessResult &result) noexcept {
  switch (result.kind) {
  case SubprocessResult::Kind::Exited:
    if (result.exit_code == 0)
      return ClipboardResult::Ok;
    // 127: утилита не найдена
    return result.exit_code == 127 ? ClipboardResult::NoConnection
                                   : ClipboardResult::ProcessFailed;
  case SubprocessResult::Kind::SpawnFailed:
    return ClipboardResult::NoConnection;
  case SubprocessResult::Kind::Timeout:
    return ClipboardResult::Timeout;
  case SubprocessResult::Kind::IoError:
    return ClipboardResult::ProcessFailed;
  }
  return ClipboardResult::ProcessFailed;
}

std::string normalize_line_endings(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

CommandClipboard::CommandClipboard(CommandSpec spec,
                                   std::chrono::milliseconds timeout)
    : spec_{std::move(spec)}, timeout_{timeout} {}

ClipboardRead CommandClipboard::read() {
  ClipboardRead out;

  Subprocess proc{spec_.read_argv, timeout_};
  SubprocessResult res = proc.run({}, /*capture_stdout=*/true);
  if (!res.ok()) {
    out.result = to_clipboard_result(res);
    out.error = res.error;
    return out;
  }

  if (!is_valid_utf8(res.output)) {
    out.result = ClipboardResult::ConversionFailed;
    out.error = "clipboard text is not valid UTF-8";
    return out;
  }

  out.text = spec_.normalize_crlf ? normalize_line_endings(res.output)
                                  : std::move(res.output);
  return out;
}

ClipboardResult CommandClipboard::write(std::string_view text) {
  Subprocess proc{spec_.write_argv, timeout_};
  SubprocessResult res = proc.run(text, /*capture_stdout=*/false);
  if (!res.ok()) {
    std::cerr << "[reprompt] " << spec_.name << ": " << res.error << "\n";
  }
  return to_clipboard_result(res);
}

} // namespace reprompt
