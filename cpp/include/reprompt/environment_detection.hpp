/**
 * @file environment_detection.hpp
 * @brief Определение окружения и выбор backend'а буфера обмена
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "reprompt/clipboard_port.hpp"
#include "reprompt/types.hpp"

namespace reprompt {

/// Снимок признаков окружения (заполняется probe_environment)
struct EnvironmentProbe {
  std::string kernel_release; // /proc/sys/kernel/osrelease
  bool wsl_env = false;       // WSL_DISTRO_NAME / WSL_INTEROP
  std::string wayland_display;
  std::string x11_display;
  bool has_wl_clipboard = false; // wl-paste и wl-copy в PATH
};

/// Определяет WSL по строке версии ядра (case-insensitive токены)
[[nodiscard]] bool is_wsl_kernel_release(std::string_view release) noexcept;

/// Собирает признаки текущего окружения
[[nodiscard]] EnvironmentProbe probe_environment();

/**
 * @brief Выбирает backend: WSL -> Wayland -> X11
 *
 * Никогда не возвращает Auto; если ничего не найдено — X11 (чтение вернёт
 * NoConnection).
 */
[[nodiscard]] BackendKind detect_backend(const EnvironmentProbe &probe) noexcept;

/// Создаёт backend нужного типа (Auto разрешается через probe_environment)
[[nodiscard]] std::unique_ptr<ClipboardPort>
make_clipboard_backend(BackendKind kind, std::chrono::milliseconds timeout);

[[nodiscard]] std::string_view to_string(BackendKind kind) noexcept;

/// Разбирает имя backend'а из конфигурации
[[nodiscard]] std::optional<BackendKind>
parse_backend_kind(std::string_view name) noexcept;

} // namespace reprompt
