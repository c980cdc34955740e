/**
 * @file line_cleaner.hpp
 * @brief Классификация строк и удаление рамок TUI
 *
 * Каждая строка независимо относится к одному из классов:
 * - PureBorder: только пробелы и псевдографика (горизонтали, углы) — удаляется
 * - ContentWrapper: содержимое между вертикальными рамками — рамки снимаются
 * - Plain: всё остальное — остаётся побайтово без изменений
 *
 * Преобразование детерминировано и идемпотентно.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace reprompt {

/// Настройки очистки (секция cleaner конфигурации)
struct CleanerOptions {
  /// Удалять ANSI escape-последовательности
  bool strip_ansi = true;

  /// Разрешать ASCII '|' в роли боковой рамки
  bool ascii_pipe_borders = true;

  /// Строка с таким числом '|' и больше считается строкой таблицы
  std::size_t table_pipe_threshold = 3;
};

/// Класс строки
enum class LineKind { PureBorder, ContentWrapper, Plain };

/**
 * @brief Результат классификации строки
 *
 * Для ContentWrapper @c content — срез исходной строки без рамок и
 * хвостовых пробелов, @c indent — его ведущие пробелы (сохраняются как есть).
 */
struct LineClass {
  LineKind kind = LineKind::Plain;
  std::string_view content;
  std::string_view indent;
};

/**
 * @brief Удаляет ANSI escape-последовательности (CSI, OSC, DCS, ESC x)
 * @param line Строка без перевода строки
 * @return Строка без управляющих последовательностей
 */
[[nodiscard]] std::string strip_ansi_escapes(std::string_view line);

/**
 * @brief Классифицирует одну строку (escape-последовательности уже удалены)
 */
[[nodiscard]] LineClass classify_line(std::string_view line,
                                      const CleanerOptions &options = {});

/**
 * @brief Очищает одну строку
 * @return Очищенная строка или nullopt, если строку нужно удалить
 *
 * Вложенные рамки снимаются до неподвижной точки, чтобы повторная очистка
 * ничего не меняла.
 */
[[nodiscard]] std::optional<std::string>
clean_line(std::string_view line, const CleanerOptions &options = {});

/**
 * @brief Очищает текст целиком
 *
 * Разбивает по '\n' (хвостовые '\r' считаются частью перевода строки),
 * очищает строки и склеивает через '\n'.
 */
[[nodiscard]] std::string clean_text(std::string_view text,
                                     const CleanerOptions &options = {});

} // namespace reprompt
