/**
 * @file transaction.hpp
 * @brief Транзакционный конвейер очистки буфера обмена
 *
 * Пять фаз: Snapshot -> Transform -> Validate -> Commit -> Verify.
 * Не более одной записи «вперёд» за запуск; при любой ошибке после записи
 * снапшот возвращается в буфер (best-effort).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "reprompt/clipboard_port.hpp"
#include "reprompt/line_cleaner.hpp"
#include "reprompt/mojibake.hpp"
#include "reprompt/types.hpp"

namespace reprompt {

/// Минимальная доля значимых символов, которая должна пережить очистку
inline constexpr double kDefaultMinRetainedRatio = 0.5;

/// Предел повторов восстановления и очистки в transform_text
inline constexpr std::size_t kMaxTransformPasses = 4;

/// Фаза конечного автомата
enum class Phase {
  Idle,
  Snapshotting,
  Transforming,
  Validating,
  Committing,
  Verifying,
  Done
};

/// Итог запуска
enum class OutcomeKind {
  Committed,     // Новый текст записан и подтверждён чтением
  NoOpIdentical, // Очистка ничего не изменила, записи не было
  DryRun,        // Режим --dry-run: проверено, но не записано
  RolledBack,    // Запись отклонена или откачена
  Failed         // Backend недоступен, буфер не трогали
};

/// Причина неуспеха
enum class FailureReason {
  None,
  BackendUnavailable,
  ValidationRejected,
  WriteFailed,
  VerificationMismatch
};

[[nodiscard]] std::string_view to_string(FailureReason reason) noexcept;

/// Параметры конвейера (собираются из Config)
struct PipelineOptions {
  CleanerOptions cleaner;
  bool mojibake_enabled = true;
  double mojibake_min_score = kDefaultMinMojibakeScore;
  double min_retained_ratio = kDefaultMinRetainedRatio;
  bool dry_run = false;
  bool verbose = false;
};

/// Вердикт проверки безопасности результата
struct ValidationVerdict {
  bool safe = true;
  std::string reason;
};

/**
 * @brief Внешне наблюдаемый результат одного запуска
 */
struct TransactionOutcome {
  OutcomeKind kind = OutcomeKind::NoOpIdentical;
  FailureReason reason = FailureReason::None;

  /// Committed / DryRun: очищенный текст
  std::string text;

  /// Подробности ошибки (для RolledBack / Failed)
  std::string detail;

  bool restore_attempted = false;
  bool restore_failed = false;

  MojibakeVerdict::Status mojibake = MojibakeVerdict::Status::Clean;

  [[nodiscard]] bool success() const noexcept {
    return kind == OutcomeKind::Committed ||
           kind == OutcomeKind::NoOpIdentical || kind == OutcomeKind::DryRun;
  }

  /// Код возврата процесса: 0 успех, 1 откат, 2 backend недоступен
  [[nodiscard]] int exit_code() const noexcept {
    if (success())
      return 0;
    return kind == OutcomeKind::Failed ? 2 : 1;
  }
};

/**
 * @brief Фаза Transform: mojibake recovery, затем очистка строк
 *
 * Пара шагов повторяется, пока текст не перестанет меняться, так что
 * повторный вызов на результате ничего не меняет.
 *
 * @param snapshot Текст снапшота (не модифицируется)
 * @param options Параметры конвейера
 * @param verdict Необязательный выход: вердикт первого прохода (или первого
 *                прохода, где текст был восстановлен)
 * @return Новый текст, всегда полученный заново из снапшота
 */
[[nodiscard]] std::string transform_text(std::string_view snapshot,
                                         const PipelineOptions &options,
                                         MojibakeVerdict *verdict = nullptr);

/**
 * @brief Количество значимых символов
 *
 * Не учитываются пробелы, управляющие символы, псевдографика и ASCII '|'.
 */
[[nodiscard]] std::size_t count_significant(std::string_view text) noexcept;

/**
 * @brief Фаза Validate: защита от слишком агрессивной очистки
 *
 * @param before Текст, поданный на очистку
 * @param after Результат очистки
 * @param min_retained_ratio Минимальная доля значимых символов
 */
[[nodiscard]] ValidationVerdict
validate_transform(std::string_view before, std::string_view after,
                   double min_retained_ratio = kDefaultMinRetainedRatio);

/**
 * @brief Контроллер транзакции
 *
 * Один объект — один запуск. Снапшот принадлежит контроллеру и используется
 * только для отката.
 */
class TransactionController {
public:
  TransactionController(ClipboardPort &port, PipelineOptions options);

  TransactionController(const TransactionController &) = delete;
  TransactionController &operator=(const TransactionController &) = delete;

  /// Выполняет все фазы и возвращает итог
  [[nodiscard]] TransactionOutcome run();

  [[nodiscard]] Phase phase() const noexcept { return phase_; }

  /// Снапшот, снятый в начале запуска
  [[nodiscard]] const ClipboardPayload &snapshot() const noexcept {
    return snapshot_;
  }

private:
  /// Best-effort возврат снапшота в буфер
  void restore(TransactionOutcome &outcome);

  TransactionOutcome finish(TransactionOutcome outcome);

  ClipboardPort &port_;
  PipelineOptions options_;
  Phase phase_ = Phase::Idle;
  ClipboardPayload snapshot_;
  std::uint64_t next_sequence_ = 1;
};

} // namespace reprompt
