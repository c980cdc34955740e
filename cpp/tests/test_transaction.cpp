#include "reprompt/mojibake.hpp"
#include "reprompt/transaction.hpp"
#include "reprompt/utf8.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

[[noreturn]] void test_fail(const char* expr, const char* file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr) \
  do { \
    if (!(expr)) { \
      test_fail(#expr, __FILE__, __LINE__); \
    } \
  } while (0)

using reprompt::ClipboardRead;
using reprompt::ClipboardResult;
using reprompt::FailureReason;
using reprompt::OutcomeKind;
using reprompt::PipelineOptions;
using reprompt::TransactionController;

/// Буфер в памяти с заранее заданными сбоями
class FakeClipboard final : public reprompt::ClipboardPort {
public:
  explicit FakeClipboard(std::string initial) : content{std::move(initial)} {}

  ClipboardRead read() override {
    ClipboardRead out;
    const std::size_t n = reads++;
    if (n < read_script.size() && read_script[n] != ClipboardResult::Ok) {
      out.result = read_script[n];
      return out;
    }
    out.text = content;
    return out;
  }

  ClipboardResult write(std::string_view text) override {
    const std::size_t n = writes.size();
    writes.emplace_back(text);
    if (n < write_script.size() && write_script[n] != ClipboardResult::Ok) {
      return write_script[n];
    }
    content = std::string{text};
    if (replace_after_write) {
      // Другое приложение перехватило буфер сразу после нашей записи
      content = *replace_after_write;
      replace_after_write.reset();
    }
    return ClipboardResult::Ok;
  }

  std::string_view name() const noexcept override { return "fake"; }

  std::string content;
  std::vector<ClipboardResult> read_script;
  std::vector<ClipboardResult> write_script;
  std::optional<std::string> replace_after_write;

  std::size_t reads = 0;
  std::vector<std::string> writes;
};

std::string corrupt(const std::string& text) {
  std::string out;
  for (char c : text) {
    reprompt::append_utf8(out,
                          reprompt::cp1252_decode(static_cast<unsigned char>(c)));
  }
  return out;
}

const std::string kBox =
    "╭──────────────╮\n"
    "│ > run tests  │\n"
    "│   and deploy │\n"
    "╰──────────────╯\n";
const std::string kCleanBox = "> run tests\n  and deploy\n";

void test_commit() {
  FakeClipboard clip{kBox};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::Committed);
  CHECK(outcome.reason == FailureReason::None);
  CHECK(outcome.text == kCleanBox);
  CHECK(outcome.exit_code() == 0);
  CHECK(!outcome.restore_attempted);

  CHECK(clip.content == kCleanBox);
  CHECK(clip.writes.size() == 1);
  CHECK(clip.reads == 2);

  CHECK(controller.phase() == reprompt::Phase::Done);
  CHECK(controller.snapshot().text() == kBox);
  CHECK(controller.snapshot().sequence() == 1);
}

void test_noop_when_nothing_to_clean() {
  FakeClipboard clip{"just some prose\n| a | b | c |\n"};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::NoOpIdentical);
  CHECK(outcome.success());
  CHECK(outcome.exit_code() == 0);
  CHECK(clip.writes.empty());
  CHECK(clip.reads == 1);
}

void test_read_failure() {
  FakeClipboard clip{kBox};
  clip.read_script = {ClipboardResult::NoConnection};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::Failed);
  CHECK(outcome.reason == FailureReason::BackendUnavailable);
  CHECK(outcome.exit_code() == 2);
  CHECK(!outcome.detail.empty());
  CHECK(clip.writes.empty());
  CHECK(controller.phase() == reprompt::Phase::Done);
}

void test_empty_result_rejected() {
  const std::string only_borders = "╭────╮\n╰────╯";
  FakeClipboard clip{only_borders};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::RolledBack);
  CHECK(outcome.reason == FailureReason::ValidationRejected);
  CHECK(outcome.exit_code() == 1);
  CHECK(!outcome.restore_attempted);
  CHECK(clip.writes.empty());
  CHECK(clip.content == only_borders);
}

void test_validate_transform() {
  using reprompt::validate_transform;

  CHECK(validate_transform("", "").safe);
  CHECK(validate_transform("│ x │", "x").safe);
  CHECK(validate_transform("abcdefghij", "abcdefgh").safe);
  CHECK(!validate_transform("abcdefghij", "ab").safe);
  CHECK(!validate_transform("abc", "\n  \n").safe);
  CHECK(validate_transform("abcdefghij", "ab", 0.1).safe);

  // Escape-коды не входят в базу сравнения
  CHECK(validate_transform("\x1b[31mab\x1b[0m", "ab").safe);

  CHECK(reprompt::count_significant("│ a|b ─ c\t\n") == 3);
}

void test_write_failure_restores() {
  FakeClipboard clip{kBox};
  clip.write_script = {ClipboardResult::ProcessFailed};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::RolledBack);
  CHECK(outcome.reason == FailureReason::WriteFailed);
  CHECK(outcome.restore_attempted);
  CHECK(!outcome.restore_failed);
  CHECK(clip.writes.size() == 2);
  CHECK(clip.writes.back() == kBox);
  CHECK(clip.content == kBox);
}

void test_verify_mismatch_restores() {
  FakeClipboard clip{kBox};
  clip.replace_after_write = "someone else copied this";
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::RolledBack);
  CHECK(outcome.reason == FailureReason::VerificationMismatch);
  CHECK(outcome.restore_attempted);
  CHECK(!outcome.restore_failed);
  CHECK(clip.content == kBox);
  CHECK(outcome.exit_code() == 1);
}

void test_verify_read_failure_restores() {
  FakeClipboard clip{kBox};
  clip.read_script = {ClipboardResult::Ok, ClipboardResult::Timeout};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::RolledBack);
  CHECK(outcome.reason == FailureReason::VerificationMismatch);
  CHECK(outcome.restore_attempted);
  CHECK(clip.content == kBox);
}

void test_restore_failure_reported() {
  FakeClipboard clip{kBox};
  clip.write_script = {ClipboardResult::Timeout, ClipboardResult::Timeout};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::RolledBack);
  CHECK(outcome.reason == FailureReason::WriteFailed);
  CHECK(outcome.restore_attempted);
  CHECK(outcome.restore_failed);
  CHECK(outcome.exit_code() == 1);
}

void test_dry_run_leaves_clipboard() {
  FakeClipboard clip{kBox};
  PipelineOptions options;
  options.dry_run = true;
  TransactionController controller{clip, options};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::DryRun);
  CHECK(outcome.text == kCleanBox);
  CHECK(outcome.exit_code() == 0);
  CHECK(clip.writes.empty());
  CHECK(clip.content == kBox);
}

void test_mojibake_repaired_then_cleaned() {
  FakeClipboard clip{corrupt(kBox)};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::Committed);
  CHECK(outcome.mojibake == reprompt::MojibakeVerdict::Status::Recovered);
  CHECK(clip.content == kCleanBox);
}

void test_mojibake_disabled() {
  const std::string garbled = corrupt("╭────╮\n╰────╯");
  FakeClipboard clip{garbled};
  PipelineOptions options;
  options.mojibake_enabled = false;
  TransactionController controller{clip, options};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::NoOpIdentical);
  CHECK(clip.content == garbled);
}

void test_unrecoverable_still_cleaned() {
  FakeClipboard clip{"│ â”€é │"};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::Committed);
  CHECK(outcome.mojibake == reprompt::MojibakeVerdict::Status::Unrecoverable);
  CHECK(clip.content == "â”€é");
}

void test_transform_idempotent() {
  const PipelineOptions options{};
  const std::vector<std::string> samples = {
      kBox,
      corrupt(kBox),
      "│ │ nested │ │\n",
      "| a | b | c |\n|---|---|---|",
      "\x1b[32m│\x1b[0m colored \x1b[32m│\x1b[0m",
      "plain",
      corrupt(corrupt("│ x │")) + "\n" + corrupt("│ y │"),
      "„Fuß“ ist gut\nCAFÉ\u00A0!",
  };

  for (const auto& sample : samples) {
    const std::string once = reprompt::transform_text(sample, options);
    CHECK(reprompt::transform_text(once, options) == once);
  }

  reprompt::MojibakeVerdict verdict;
  CHECK(reprompt::transform_text(
            corrupt(corrupt("│ x │")) + "\n" + corrupt("│ y │"), options,
            &verdict) == "x\ny");
  CHECK(verdict.status == reprompt::MojibakeVerdict::Status::Recovered);
  CHECK(verdict.layers == 2);
}

void test_transform_repairs_after_borders_removed() {
  // Одна повреждённая строка среди множества рамок ниже порога; после
  // удаления рамок она остаётся одна и восстанавливается
  std::string input;
  for (int i = 0; i < 25; ++i) {
    input += "├──────┤\n";
  }
  input += corrupt("│ x │");

  const PipelineOptions options{};
  reprompt::MojibakeVerdict verdict;
  const std::string once = reprompt::transform_text(input, options, &verdict);
  CHECK(once == "x");
  CHECK(verdict.status == reprompt::MojibakeVerdict::Status::Recovered);
  CHECK(reprompt::transform_text(once, options) == once);
}

void test_clean_accented_text_not_rewritten() {
  const std::string text = "„Fuß“ ist gut\nCAFÉ\u00A0!\nGröße: 10 cm, ÉTÉ »\n";
  FakeClipboard clip{text};
  TransactionController controller{clip, PipelineOptions{}};

  auto outcome = controller.run();
  CHECK(outcome.kind == OutcomeKind::NoOpIdentical);
  CHECK(outcome.mojibake == reprompt::MojibakeVerdict::Status::Clean);
  CHECK(clip.writes.empty());
  CHECK(clip.content == text);
}

} // namespace

#undef CHECK

int main() {
  test_commit();
  test_noop_when_nothing_to_clean();
  test_read_failure();
  test_empty_result_rejected();
  test_validate_transform();
  test_write_failure_restores();
  test_verify_mismatch_restores();
  test_verify_read_failure_restores();
  test_restore_failure_reported();
  test_dry_run_leaves_clipboard();
  test_mojibake_repaired_then_cleaned();
  test_mojibake_disabled();
  test_unrecoverable_still_cleaned();
  test_transform_idempotent();
  test_transform_repairs_after_borders_removed();
  test_clean_accented_text_not_rewritten();

  std::cout << "OK\n";
  return 0;
}
