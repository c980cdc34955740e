/**
 * @file mojibake.hpp
 * @brief Детектирование и восстановление mojibake (UTF-8 -> Windows-1252)
 *
 * Типичный сценарий: рамка TUI (U+2500 - U+257F, три байта в UTF-8) прошла
 * через декодер Windows-1252 побайтово и превратилась в «â”€». Восстановление
 * кодирует такие участки обратно в байты Windows-1252 и декодирует их как
 * UTF-8.
 *
 * Чистые функции, без побочных эффектов.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace reprompt {

/// Минимальная доля строк с маркерами, начиная с которой чиним текст
inline constexpr double kDefaultMinMojibakeScore = 0.05;

/// Сколько слоёв повторного декодирования снимается за один вызов
inline constexpr std::size_t kMaxMojibakeLayers = 3;

/**
 * @brief Вердикт детектора mojibake
 */
struct MojibakeVerdict {
  enum class Status {
    Clean,        // Повреждений нет (или ниже порога)
    Recovered,    // text содержит восстановленный текст
    Unrecoverable // Повреждение найдено, но восстановление невалидно
  };

  Status status = Status::Clean;

  /// Восстановленный текст (только для Recovered)
  std::string text;

  /// Доля непустых строк с маркерами повреждения до восстановления
  double score = 0.0;

  /// То же после восстановления (для Recovered)
  double score_after = 0.0;

  /// Число снятых слоёв неверного декодирования
  std::size_t layers = 0;

  std::size_t corrupted_lines = 0;
  std::size_t box_chars_before = 0;
  std::size_t box_chars_after = 0;
};

/**
 * @brief Символ Windows-1252 для байта
 *
 * Неопределённые позиции (0x81, 0x8D, 0x8F, 0x90, 0x9D) отображаются в
 * соответствующие управляющие символы C1, как это делает Windows.
 */
[[nodiscard]] char32_t cp1252_decode(unsigned char byte) noexcept;

/**
 * @brief Байт Windows-1252 для не-ASCII символа
 * @return Байт 0x80-0xFF или nullopt, если символ не представим
 */
[[nodiscard]] std::optional<unsigned char> cp1252_encode(char32_t cp) noexcept;

/**
 * @brief Доля непустых строк, содержащих хотя бы один маркер повреждения
 *
 * Маркер — непрерывный участок не-ASCII символов, представимых в
 * Windows-1252, чей байтовый образ содержит полную последовательность UTF-8
 * длиной 3-4 байта (так выглядят «â”€», «â•‘», «â€™»).
 */
[[nodiscard]] double mojibake_score(std::string_view text);

/**
 * @brief Обнаруживает и при возможности восстанавливает mojibake
 *
 * @param text Исходный текст (снапшот буфера обмена)
 * @param min_score Порог срабатывания (доля строк)
 * @return Вердикт; исходный текст никогда не модифицируется
 */
[[nodiscard]] MojibakeVerdict
detect_and_recover(std::string_view text,
                   double min_score = kDefaultMinMojibakeScore);

} // namespace reprompt
