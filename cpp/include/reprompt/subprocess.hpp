/**
 * @file subprocess.hpp
 * @brief Дочерний процесс с ограниченным временем ожидания
 *
 * RAII: пайпы закрываются, процесс гарантированно завершается (SIGKILL)
 * и пожинается на любом пути выхода.
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace reprompt {

/// Результат запуска вспомогательного процесса
struct SubprocessResult {
  enum class Kind {
    Exited,      // Процесс завершился сам (см. exit_code)
    SpawnFailed, // pipe/fork/exec не удались
    Timeout,     // Превышен дедлайн, процесс убит
    IoError      // Ошибка обмена данными
  };

  Kind kind = Kind::Exited;
  int exit_code = -1;
  std::string output; // stdout (если захватывался)
  std::string error;

  [[nodiscard]] bool ok() const noexcept {
    return kind == Kind::Exited && exit_code == 0;
  }
};

/**
 * @brief Запуск внешней команды: данные в stdin, stdout обратно
 */
class Subprocess {
public:
  /**
   * @param argv Аргументы; argv[0] ищется в PATH
   * @param timeout Общий дедлайн на обмен данными и завершение
   */
  Subprocess(std::vector<std::string> argv, std::chrono::milliseconds timeout);

  ~Subprocess();

  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Запускает процесс и ждёт завершения
   *
   * @param input Данные для stdin (после записи stdin закрывается)
   * @param capture_stdout Захватывать stdout; иначе stdout -> /dev/null
   *
   * Если stdout не захватывается, процесс-демон (xclip, xsel), унаследовавший
   * дескрипторы, не может задержать нас на пайпе.
   */
  [[nodiscard]] SubprocessResult run(std::string_view input,
                                     bool capture_stdout);

private:
  /// Убивает и пожинает процесс, закрывает дескрипторы
  void cleanup() noexcept;

  std::vector<std::string> argv_;
  std::chrono::milliseconds timeout_;

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
};

/**
 * @brief Проверяет, найдётся ли исполняемый файл в PATH
 */
[[nodiscard]] bool find_in_path(std::string_view program);

} // namespace reprompt
