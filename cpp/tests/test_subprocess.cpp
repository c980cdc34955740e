#include "reprompt/command_clipboard.hpp"
#include "reprompt/subprocess.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <signal.h>
#include <string>

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

using namespace std::chrono_literals;
using reprompt::ClipboardResult;
using reprompt::Subprocess;
using reprompt::SubprocessResult;

void test_echo_through_cat() {
  Subprocess proc{{"cat"}, 2000ms};
  auto res = proc.run("hello\nworld", true);
  CHECK(res.ok());
  CHECK(res.output == "hello\nworld");
}

void test_large_input() {
  // Больше ёмкости пайпа: запись и чтение должны чередоваться
  const std::string input(1 << 20, 'x');
  Subprocess proc{{"cat"}, 5000ms};
  auto res = proc.run(input, true);
  CHECK(res.ok());
  CHECK(res.output.size() == input.size());
}

void test_exit_code() {
  Subprocess proc{{"sh", "-c", "exit 3"}, 2000ms};
  auto res = proc.run({}, false);
  CHECK(res.kind == SubprocessResult::Kind::Exited);
  CHECK(res.exit_code == 3);
  CHECK(!res.ok());
  CHECK(!res.error.empty());
}

void test_timeout() {
  const auto start = std::chrono::steady_clock::now();
  Subprocess proc{{"sleep", "5"}, 200ms};
  auto res = proc.run({}, false);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  CHECK(res.kind == SubprocessResult::Kind::Timeout);
  CHECK(elapsed < 3s);
}

void test_missing_command() {
  Subprocess proc{{"reprompt-no-such-helper"}, 2000ms};
  auto res = proc.run({}, true);
  CHECK(res.kind == SubprocessResult::Kind::Exited);
  CHECK(res.exit_code == 127);
  CHECK(reprompt::to_clipboard_result(res) == ClipboardResult::NoConnection);

  Subprocess empty{{}, 100ms};
  CHECK(empty.run({}, false).kind == SubprocessResult::Kind::SpawnFailed);
}

void test_find_in_path() {
  CHECK(reprompt::find_in_path("sh"));
  CHECK(reprompt::find_in_path("/bin/sh"));
  CHECK(!reprompt::find_in_path("reprompt-no-such-helper"));
  CHECK(!reprompt::find_in_path(""));
}

void test_command_clipboard() {
  reprompt::CommandSpec spec;
  spec.name = "test";
  spec.read_argv = {"printf", "a\\r\\nb"};
  spec.write_argv = {"false"};
  spec.normalize_crlf = true;

  reprompt::CommandClipboard clip{spec, 2000ms};
  CHECK(clip.name() == "test");

  auto read = clip.read();
  CHECK(read.ok());
  CHECK(read.text == "a\nb");

  CHECK(clip.write("payload") == ClipboardResult::ProcessFailed);

  reprompt::CommandSpec broken;
  broken.name = "broken";
  broken.read_argv = {"printf", "\\377"};
  broken.write_argv = {"cat"};
  reprompt::CommandClipboard bad{broken, 2000ms};
  CHECK(bad.read().result == ClipboardResult::ConversionFailed);
  CHECK(bad.write("payload") == ClipboardResult::Ok);
}

} // namespace

#undef CHECK

int main() {
  // Как в main: ранний выход дочернего процесса даёт EPIPE, а не сигнал
  ::signal(SIGPIPE, SIG_IGN);

  test_echo_through_cat();
  test_large_input();
  test_exit_code();
  test_timeout();
  test_missing_command();
  test_find_in_path();
  test_command_clipboard();

  std::cout << "OK\n";
  return 0;
}
