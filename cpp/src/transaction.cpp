/**
 * @file transaction.cpp
 * @brief Реализация транзакционного конвейера
 */

#include "reprompt/transaction.hpp"
#include "reprompt/utf8.hpp"

#include <iostream>
#include <utility>

namespace reprompt {

namespace {

[[nodiscard]] bool is_blank(std::string_view text) noexcept {
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = decode_utf8_lossy(text, pos);
    if (!is_space(cp) && cp != '\n') {
      return false;
    }
  }
  return true;
}

[[nodiscard]] bool is_control(char32_t cp) noexcept {
  return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F);
}

} // namespace

std::string_view to_string(FailureReason reason) noexcept {
  switch (reason) {
  case FailureReason::None:
    return "none";
  case FailureReason::BackendUnavailable:
    return "clipboard backend unavailable";
  case FailureReason::ValidationRejected:
    return "validation rejected the cleaned text";
  case FailureReason::WriteFailed:
    return "clipboard write failed";
  case FailureReason::VerificationMismatch:
    return "clipboard read-back did not match";
  }
  return "unknown";
}

std::string transform_text(std::string_view snapshot,
                           const PipelineOptions &options,
                           MojibakeVerdict *verdict) {
  MojibakeVerdict reported;
  std::string current{snapshot};

  // Удаление рамок меняет долю повреждённых строк, поэтому восстановление и
  // очистка повторяются до неподвижной точки
  for (std::size_t pass = 0; pass < kMaxTransformPasses; ++pass) {
    MojibakeVerdict local;
    if (options.mojibake_enabled) {
      local = detect_and_recover(current, options.mojibake_min_score);
    }

    const bool recovered = local.status == MojibakeVerdict::Status::Recovered;
    std::string next =
        clean_text(recovered ? std::string_view{local.text}
                             : std::string_view{current},
                   options.cleaner);

    if (pass == 0 ||
        (recovered && reported.status != MojibakeVerdict::Status::Recovered)) {
      reported = std::move(local);
    }

    if (next == current) {
      break;
    }
    current = std::move(next);
  }

  if (verdict) {
    *verdict = std::move(reported);
  }
  return current;
}

std::size_t count_significant(std::string_view text) noexcept {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = decode_utf8_lossy(text, pos);
    if (is_space(cp) || is_control(cp) || is_box_drawing(cp) || cp == '|') {
      continue;
    }
    ++count;
  }
  return count;
}

ValidationVerdict validate_transform(std::string_view before,
                                     std::string_view after,
                                     double min_retained_ratio) {
  ValidationVerdict verdict;

  if (!is_blank(before) && is_blank(after)) {
    verdict.safe = false;
    verdict.reason = "cleaned text is empty";
    return verdict;
  }

  // Escape-последовательности удаляются всегда и значимыми не считаются
  const std::size_t sig_before = count_significant(strip_ansi_escapes(before));
  if (sig_before == 0) {
    return verdict;
  }

  const std::size_t sig_after = count_significant(after);
  const double ratio =
      static_cast<double>(sig_after) / static_cast<double>(sig_before);
  if (ratio < min_retained_ratio) {
    verdict.safe = false;
    verdict.reason = "only " + std::to_string(sig_after) + " of " +
                     std::to_string(sig_before) +
                     " significant characters would survive";
    return verdict;
  }

  return verdict;
}

TransactionController::TransactionController(ClipboardPort &port,
                                             PipelineOptions options)
    : port_{port}, options_{std::move(options)} {}

TransactionOutcome TransactionController::finish(TransactionOutcome outcome) {
  phase_ = Phase::Done;
  if (options_.verbose) {
    std::cerr << "[reprompt] Outcome: "
              << (outcome.success() ? std::string_view{"ok"}
                                 : to_string(outcome.reason))
              << "\n";
  }
  return outcome;
}

void TransactionController::restore(TransactionOutcome &outcome) {
  outcome.restore_attempted = true;

  ClipboardResult res = port_.write(snapshot_.text());
  if (res != ClipboardResult::Ok) {
    outcome.restore_failed = true;
    std::cerr << "[reprompt] Error: failed to restore original clipboard ("
              << to_string(res) << ")\n";
    return;
  }

  if (options_.verbose) {
    std::cerr << "[reprompt] Original clipboard restored\n";
  }
}

TransactionOutcome TransactionController::run() {
  TransactionOutcome outcome;

  // Snapshot
  phase_ = Phase::Snapshotting;
  ClipboardRead current = port_.read();
  if (!current.ok()) {
    outcome.kind = OutcomeKind::Failed;
    outcome.reason = FailureReason::BackendUnavailable;
    outcome.detail = current.error.empty()
                         ? std::string{to_string(current.result)}
                         : current.error;
    std::cerr << "[reprompt] Error reading clipboard via " << port_.name()
              << ": " << outcome.detail << "\n";
    return finish(std::move(outcome));
  }
  snapshot_ = ClipboardPayload{std::move(current.text), next_sequence_++};

  // Transform
  phase_ = Phase::Transforming;
  MojibakeVerdict mojibake;
  std::string transformed =
      transform_text(snapshot_.text(), options_, &mojibake);
  outcome.mojibake = mojibake.status;

  if (mojibake.status == MojibakeVerdict::Status::Unrecoverable) {
    std::cerr << "[reprompt] Warning: encoding corruption detected in "
              << mojibake.corrupted_lines
              << " line(s) but could not be repaired\n";
  } else if (mojibake.status == MojibakeVerdict::Status::Recovered &&
             options_.verbose) {
    std::cerr << "[reprompt] Repaired mojibake in " << mojibake.corrupted_lines
              << " line(s), box glyphs " << mojibake.box_chars_before << " -> "
              << mojibake.box_chars_after << "\n";
  }

  if (transformed == snapshot_.text()) {
    outcome.kind = OutcomeKind::NoOpIdentical;
    outcome.text = std::move(transformed);
    return finish(std::move(outcome));
  }

  // Validate
  phase_ = Phase::Validating;
  std::string_view baseline = snapshot_.text();
  if (mojibake.status == MojibakeVerdict::Status::Recovered) {
    baseline = mojibake.text;
  }
  ValidationVerdict validation = validate_transform(
      baseline, transformed, options_.min_retained_ratio);
  if (!validation.safe) {
    outcome.kind = OutcomeKind::RolledBack;
    outcome.reason = FailureReason::ValidationRejected;
    outcome.detail = std::move(validation.reason);
    std::cerr << "[reprompt] Commit refused: " << outcome.detail << "\n";
    return finish(std::move(outcome));
  }

  if (options_.dry_run) {
    outcome.kind = OutcomeKind::DryRun;
    outcome.text = std::move(transformed);
    return finish(std::move(outcome));
  }

  // Commit
  phase_ = Phase::Committing;
  ClipboardResult written = port_.write(transformed);
  if (written != ClipboardResult::Ok) {
    outcome.kind = OutcomeKind::RolledBack;
    outcome.reason = FailureReason::WriteFailed;
    outcome.detail = std::string{to_string(written)};
    std::cerr << "[reprompt] Error writing clipboard via " << port_.name()
              << ": " << outcome.detail << "\n";
    // Запись могла частично состояться
    restore(outcome);
    return finish(std::move(outcome));
  }

  // Verify
  phase_ = Phase::Verifying;
  ClipboardRead readback = port_.read();
  if (!readback.ok() || readback.text != transformed) {
    outcome.kind = OutcomeKind::RolledBack;
    outcome.reason = FailureReason::VerificationMismatch;
    outcome.detail = readback.ok() ? "clipboard content changed after write"
                                   : std::string{to_string(readback.result)};
    std::cerr << "[reprompt] Verification failed: " << outcome.detail << "\n";
    restore(outcome);
    return finish(std::move(outcome));
  }

  outcome.kind = OutcomeKind::Committed;
  outcome.text = std::move(transformed);
  return finish(std::move(outcome));
}

} // namespace reprompt
