/**
 * @file main.cpp
 * @brief Точка входа reprompt
 *
 * Однократный запуск: читает буфер обмена, удаляет рамки TUI, записывает
 * результат обратно и проверяет запись.
 *
 * Запуск: reprompt
 */

#include "reprompt/config.hpp"
#include "reprompt/environment_detection.hpp"
#include "reprompt/transaction.hpp"

#include <cstdlib>
#include <iostream>
#include <signal.h>
#include <string_view>
#include <utility>

namespace {

constexpr int kExitUsage = 64;

void print_version() {
  std::cout << "reprompt " << reprompt::kVersion << "\n"
            << "Очистка буфера обмена от рамок TUI\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -h, --help     Показать эту справку\n"
            << "  -V, --version  Показать версию\n"
            << "  -v, --verbose  Подробная диагностика в stderr\n"
            << "  -n, --dry-run  Вывести очищенный текст, не трогая буфер\n"
            << "\n"
            << "Коды возврата: 0 успех, 1 откат, 2 буфер недоступен\n"
            << "\n"
            << "Конфигурация: ~/.config/reprompt/config.yaml или "
            << reprompt::kConfigPath << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
  bool verbose = false;
  bool dry_run = false;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-V" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "-v" || arg == "--verbose") {
      verbose = true;
      continue;
    }
    if (arg == "-n" || arg == "--dry-run") {
      dry_run = true;
      continue;
    }
    std::cerr << "[reprompt] Unknown option: " << arg << "\n";
    print_usage(argv[0]);
    return kExitUsage;
  }

  // Ранний выход вспомогательной утилиты не должен убивать процесс
  struct sigaction sa{};
  sa.sa_handler = SIG_IGN;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGPIPE, &sa, nullptr);

  // Загрузка конфигурации
  const reprompt::Config config = reprompt::load_config();

  reprompt::PipelineOptions options = reprompt::make_pipeline_options(config);
  options.verbose = verbose;
  options.dry_run = dry_run;

  auto backend = reprompt::make_clipboard_backend(config.clipboard.backend,
                                                  config.clipboard.timeout);
  if (verbose) {
    std::cerr << "[reprompt] Using clipboard backend: " << backend->name()
              << "\n";
  }

  reprompt::TransactionController controller{*backend, std::move(options)};
  const reprompt::TransactionOutcome outcome = controller.run();

  switch (outcome.kind) {
  case reprompt::OutcomeKind::Committed:
    std::cout << "✨\n";
    break;
  case reprompt::OutcomeKind::NoOpIdentical:
    if (dry_run) {
      std::cout << outcome.text;
    }
    break;
  case reprompt::OutcomeKind::DryRun:
    std::cout << outcome.text;
    break;
  case reprompt::OutcomeKind::RolledBack:
  case reprompt::OutcomeKind::Failed:
    std::cout << "✗ " << reprompt::to_string(outcome.reason);
    if (!outcome.detail.empty()) {
      std::cout << ": " << outcome.detail;
    }
    std::cout << "\n";
    break;
  }

  return outcome.exit_code();
}
