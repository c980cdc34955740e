/**
 * @file config.hpp
 * @brief Конфигурация reprompt
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты; файл необязателен.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "reprompt/line_cleaner.hpp"
#include "reprompt/mojibake.hpp"
#include "reprompt/transaction.hpp"
#include "reprompt/types.hpp"

namespace reprompt {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Настройки доступа к буферу обмена
struct ClipboardConfig {
  BackendKind backend = BackendKind::Auto;

  /// Таймаут одной операции чтения/записи (включая запуск утилит).
  /// powershell.exe в WSL стартует заметно дольше секунды.
  std::chrono::milliseconds timeout{3000};
};

/// Настройки детектора mojibake
struct MojibakeConfig {
  bool enabled = true;

  /// Доля строк с маркерами повреждения, начиная с которой чиним текст
  double min_score = kDefaultMinMojibakeScore;
};

/// Настройки фазы Validate
struct ValidationConfig {
  /// Минимальная доля значимых символов, переживших очистку
  double min_retained_ratio = kDefaultMinRetainedRatio;
};

/// Полная конфигурация приложения
struct Config {
  ClipboardConfig clipboard;
  CleanerOptions cleaner;
  MojibakeConfig mojibake;
  ValidationConfig validation;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

/// Параметры конвейера из конфигурации
[[nodiscard]] PipelineOptions make_pipeline_options(const Config &config);

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение.
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Парсит конфигурацию из потока
 *
 * @param input Поток с YAML (подмножество: секции и key: value)
 * @param error Заполняется описанием первой ошибки разбора
 * @return Конфигурация или nullopt при ошибке разбора
 */
[[nodiscard]] std::optional<Config> parse_config(std::istream &input,
                                                 std::string *error = nullptr);

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию (best-effort)
 *
 * Сначала ~/.config/reprompt/config.yaml, затем /etc/reprompt/config.yaml.
 * Отсутствие файла — не ошибка; битый файл — предупреждение и дефолты.
 */
[[nodiscard]] Config load_config();

/**
 * @brief Парсит таймаут в миллисекундах
 * @return Значение или std::nullopt, если число не положительное
 */
[[nodiscard]] std::optional<std::chrono::milliseconds>
parse_timeout_ms(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

} // namespace reprompt
