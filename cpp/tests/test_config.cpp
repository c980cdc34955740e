#include "reprompt/config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

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

using reprompt::BackendKind;
using reprompt::Config;
using reprompt::ConfigResult;
using reprompt::parse_config;

std::optional<Config> parse(const std::string& text,
                            std::string* error = nullptr) {
  std::istringstream in{text};
  return parse_config(in, error);
}

std::filesystem::path write_temp(const std::string& name,
                                 const std::string& text) {
  auto path = std::filesystem::temp_directory_path() /
              ("reprompt_test_" + std::to_string(::getpid()) + "_" + name);
  std::ofstream out{path};
  out << text;
  return path;
}

void test_defaults() {
  const Config config{};
  CHECK(config.clipboard.backend == BackendKind::Auto);
  CHECK(config.clipboard.timeout == std::chrono::milliseconds{3000});
  CHECK(config.cleaner.strip_ansi);
  CHECK(config.cleaner.ascii_pipe_borders);
  CHECK(config.cleaner.table_pipe_threshold == 3);
  CHECK(config.mojibake.enabled);
  CHECK(config.validation.min_retained_ratio == 0.5);
  CHECK(reprompt::validate_config(config));

  auto empty = parse("");
  CHECK(empty.has_value());
  CHECK(empty->clipboard.backend == BackendKind::Auto);
}

void test_full_file() {
  const std::string text =
      "# reprompt\n"
      "clipboard:\n"
      "  backend: wsl      # powershell.exe\n"
      "  timeout_ms: 5000\n"
      "\n"
      "cleaner:\n"
      "  strip_ansi: false\n"
      "  ascii_pipe_borders: no\n"
      "  table_pipe_threshold: 4\n"
      "mojibake:\n"
      "  enabled: off\n"
      "  min_score: 0.2\n"
      "validation:\n"
      "  min_retained_ratio: \"0.75\"\n";

  auto config = parse(text);
  CHECK(config.has_value());
  CHECK(config->clipboard.backend == BackendKind::Wsl);
  CHECK(config->clipboard.timeout == std::chrono::milliseconds{5000});
  CHECK(!config->cleaner.strip_ansi);
  CHECK(!config->cleaner.ascii_pipe_borders);
  CHECK(config->cleaner.table_pipe_threshold == 4);
  CHECK(!config->mojibake.enabled);
  CHECK(config->mojibake.min_score == 0.2);
  CHECK(config->validation.min_retained_ratio == 0.75);

  auto options = reprompt::make_pipeline_options(*config);
  CHECK(!options.cleaner.strip_ansi);
  CHECK(options.cleaner.table_pipe_threshold == 4);
  CHECK(!options.mojibake_enabled);
  CHECK(options.mojibake_min_score == 0.2);
  CHECK(options.min_retained_ratio == 0.75);
  CHECK(!options.dry_run);
}

void test_unknown_keys_ignored() {
  auto config = parse("future:\n  knob: 1\nclipboard:\n  colour: red\n"
                      "  backend: x11\n");
  CHECK(config.has_value());
  CHECK(config->clipboard.backend == BackendKind::X11);
}

void test_parse_errors() {
  std::string error;

  CHECK(!parse("clipboard:\n  backend: pasteboard\n", &error).has_value());
  CHECK(error.find("line 2") != std::string::npos);

  CHECK(!parse("clipboard:\n  timeout_ms: -5\n").has_value());
  CHECK(!parse("cleaner:\n  strip_ansi: maybe\n").has_value());
  CHECK(!parse("mojibake:\n  min_score: lots\n").has_value());

  error.clear();
  CHECK(!parse("clipboard:\n  this line has no colon\n", &error).has_value());
  CHECK(error.find("line 2") != std::string::npos);
}

void test_validate_config() {
  Config config;
  config.cleaner.table_pipe_threshold = 1;
  CHECK(!reprompt::validate_config(config));

  config = Config{};
  config.mojibake.min_score = 1.5;
  CHECK(!reprompt::validate_config(config));

  config = Config{};
  config.validation.min_retained_ratio = -0.1;
  CHECK(!reprompt::validate_config(config));

  config = Config{};
  config.clipboard.timeout = std::chrono::milliseconds{0};
  CHECK(!reprompt::validate_config(config));
}

void test_parse_timeout() {
  CHECK(reprompt::parse_timeout_ms("250").value() ==
        std::chrono::milliseconds{250});
  CHECK(!reprompt::parse_timeout_ms("0").has_value());
  CHECK(!reprompt::parse_timeout_ms("-1").has_value());
  CHECK(!reprompt::parse_timeout_ms("1s").has_value());
}

void test_load_from_file() {
  auto good = write_temp("good.yaml", "clipboard:\n  backend: wayland\n");
  auto out = reprompt::load_config_checked(good);
  CHECK(out.result == ConfigResult::Ok);
  CHECK(out.config.clipboard.backend == BackendKind::Wayland);
  CHECK(out.config.config_path == good);

  auto invalid = write_temp("invalid.yaml", "validation:\n"
                                            "  min_retained_ratio: 3\n");
  out = reprompt::load_config_checked(invalid);
  CHECK(out.result == ConfigResult::InvalidValue);
  CHECK(!out.error.empty());
  CHECK(out.config.validation.min_retained_ratio == 0.5);

  auto broken = write_temp("broken.yaml", "cleaner:\n  strip_ansi: 2\n");
  out = reprompt::load_config_checked(broken);
  CHECK(out.result == ConfigResult::ParseError);

  std::filesystem::remove(good);
  std::filesystem::remove(invalid);
  std::filesystem::remove(broken);

  out = reprompt::load_config_checked(good);
  CHECK(out.result == ConfigResult::FileNotFound);

  out = reprompt::load_config_checked(std::filesystem::path{});
  CHECK(out.result == ConfigResult::FileNotFound);
}

} // namespace

#undef CHECK

int main() {
  test_defaults();
  test_full_file();
  test_unknown_keys_ignored();
  test_parse_errors();
  test_validate_config();
  test_parse_timeout();
  test_load_from_file();

  std::cout << "OK\n";
  return 0;
}
