/**
 * @file environment_detection.cpp
 * @brief Реализация определения окружения
 */

#include "reprompt/environment_detection.hpp"
#include "reprompt/command_clipboard.hpp"
#include "reprompt/subprocess.hpp"
#include "reprompt/x11_clipboard.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace reprompt {

namespace {

// Токены в osrelease ядра WSL: "5.15.90.1-microsoft-standard-WSL2",
// "4.4.0-19041-Microsoft"
constexpr std::array kWslTokens = {"microsoft", "wsl"};

/// Проверяет, содержит ли строка подстроку (case insensitive)
[[nodiscard]] bool contains_ci(std::string_view haystack,
                               std::string_view needle) noexcept {
  if (needle.empty()) {
    return true;
  }
  if (haystack.size() < needle.size()) {
    return false;
  }

  auto it = std::search(
      haystack.begin(), haystack.end(), needle.begin(), needle.end(),
      [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
      });

  return it != haystack.end();
}

[[nodiscard]] std::string env_or_empty(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string{value} : std::string{};
}

} // namespace

bool is_wsl_kernel_release(std::string_view release) noexcept {
  if (release.empty()) {
    return false;
  }

  for (const auto &token : kWslTokens) {
    if (contains_ci(release, token)) {
      return true;
    }
  }

  return false;
}

EnvironmentProbe probe_environment() {
  EnvironmentProbe probe;

  std::ifstream file{"/proc/sys/kernel/osrelease"};
  if (file) {
    std::getline(file, probe.kernel_release);
  }

  probe.wsl_env = !env_or_empty("WSL_DISTRO_NAME").empty() ||
                  !env_or_empty("WSL_INTEROP").empty();
  probe.wayland_display = env_or_empty("WAYLAND_DISPLAY");
  probe.x11_display = env_or_empty("DISPLAY");
  probe.has_wl_clipboard = find_in_path("wl-paste") && find_in_path("wl-copy");

  return probe;
}

BackendKind detect_backend(const EnvironmentProbe &probe) noexcept {
  if (probe.wsl_env || is_wsl_kernel_release(probe.kernel_release)) {
    return BackendKind::Wsl;
  }
  if (!probe.wayland_display.empty() && probe.has_wl_clipboard) {
    return BackendKind::Wayland;
  }
  // XWayland без wl-clipboard тоже сюда
  return BackendKind::X11;
}

std::unique_ptr<ClipboardPort>
make_clipboard_backend(BackendKind kind, std::chrono::milliseconds timeout) {
  if (kind == BackendKind::Auto) {
    kind = detect_backend(probe_environment());
  }

  switch (kind) {
  case BackendKind::Wsl:
    return std::make_unique<CommandClipboard>(wsl_command_spec(), timeout);
  case BackendKind::Wayland:
    return std::make_unique<CommandClipboard>(wayland_command_spec(), timeout);
  case BackendKind::X11:
  case BackendKind::Auto:
    break;
  }
  return std::make_unique<X11Clipboard>(timeout);
}

std::string_view to_string(BackendKind kind) noexcept {
  switch (kind) {
  case BackendKind::Auto:
    return "auto";
  case BackendKind::X11:
    return "x11";
  case BackendKind::Wayland:
    return "wayland";
  case BackendKind::Wsl:
    return "wsl";
  }
  return "unknown";
}

std::optional<BackendKind> parse_backend_kind(std::string_view name) noexcept {
  if (name == "auto")
    return BackendKind::Auto;
  if (name == "x11")
    return BackendKind::X11;
  if (name == "wayland")
    return BackendKind::Wayland;
  if (name == "wsl")
    return BackendKind::Wsl;
  return std::nullopt;
}

} // namespace reprompt
