/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "reprompt/config.hpp"
#include "reprompt/environment_detection.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace reprompt {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Убирает хвостовой комментарий " # ..." и кавычки вокруг значения
std::string_view clean_value(std::string_view sv) {
  auto hash = sv.find(" #");
  if (hash != std::string_view::npos) {
    sv = sv.substr(0, hash);
  }
  sv = trim(sv);
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    sv = sv.substr(1, sv.size() - 2);
  }
  return sv;
}

/// Парсит целое число из строки
std::optional<int> parse_int(std::string_view sv) {
  sv = trim(sv);
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит число с плавающей точкой из строки
std::optional<double> parse_double(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty()) {
    return std::nullopt;
  }
  // std::from_chars для double не везде поддерживается, используем strtod
  std::string str{sv};
  char *end = nullptr;
  double value = std::strtod(str.c_str(), &end);
  if (end == str.c_str() + str.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Получает путь к user config (~/.config/reprompt/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

/// Применяет пару key: value; false — значение не разобрано
bool apply_value(Config &config, std::string_view section, std::string_view key,
                 std::string_view value) {
  if (section == "clipboard") {
    if (key == "backend") {
      auto kind = parse_backend_kind(value);
      if (!kind)
        return false;
      config.clipboard.backend = *kind;
    } else if (key == "timeout_ms") {
      auto timeout = parse_timeout_ms(value);
      if (!timeout)
        return false;
      config.clipboard.timeout = *timeout;
    }
  } else if (section == "cleaner") {
    if (key == "strip_ansi") {
      auto val = parse_bool(value);
      if (!val)
        return false;
      config.cleaner.strip_ansi = *val;
    } else if (key == "ascii_pipe_borders") {
      auto val = parse_bool(value);
      if (!val)
        return false;
      config.cleaner.ascii_pipe_borders = *val;
    } else if (key == "table_pipe_threshold") {
      auto val = parse_int(value);
      if (!val || *val < 0)
        return false;
      config.cleaner.table_pipe_threshold = static_cast<std::size_t>(*val);
    }
  } else if (section == "mojibake") {
    if (key == "enabled") {
      auto val = parse_bool(value);
      if (!val)
        return false;
      config.mojibake.enabled = *val;
    } else if (key == "min_score") {
      auto val = parse_double(value);
      if (!val)
        return false;
      config.mojibake.min_score = *val;
    }
  } else if (section == "validation") {
    if (key == "min_retained_ratio") {
      auto val = parse_double(value);
      if (!val)
        return false;
      config.validation.min_retained_ratio = *val;
    }
  }
  // Неизвестные секции и ключи пропускаем
  return true;
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_timeout_ms(std::string_view value) {
  auto ms = parse_int(value);
  if (ms && *ms > 0) {
    return std::chrono::milliseconds{*ms};
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  if (config.clipboard.timeout.count() <= 0) {
    return false;
  }

  // Меньше двух '|' — любая строка с рамкой окажется «таблицей»
  if (config.cleaner.table_pipe_threshold < 2) {
    return false;
  }

  if (config.mojibake.min_score < 0.0 || config.mojibake.min_score > 1.0) {
    return false;
  }

  if (config.validation.min_retained_ratio < 0.0 ||
      config.validation.min_retained_ratio > 1.0) {
    return false;
  }

  return true;
}

PipelineOptions make_pipeline_options(const Config &config) {
  PipelineOptions options;
  options.cleaner = config.cleaner;
  options.mojibake_enabled = config.mojibake.enabled;
  options.mojibake_min_score = config.mojibake.min_score;
  options.min_retained_ratio = config.validation.min_retained_ratio;
  return options;
}

std::optional<Config> parse_config(std::istream &input, std::string *error) {
  Config config;

  std::string line;
  std::string current_section;
  std::size_t line_no = 0;

  while (std::getline(input, line)) {
    ++line_no;
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      if (error) {
        *error = "line " + std::to_string(line_no) + ": expected 'key: value'";
      }
      return std::nullopt;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = clean_value(sv.substr(colon_pos + 1));

    // Определение секции
    if (value.empty()) {
      current_section = std::string{key};
      continue;
    }

    if (!apply_value(config, current_section, key, value)) {
      if (error) {
        *error = "line " + std::to_string(line_no) + ": invalid value for '" +
                 std::string{key} + "'";
      }
      return std::nullopt;
    }
  }

  return config;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  std::string parse_error;
  auto parsed = parse_config(file, &parse_error);
  if (!parsed) {
    out.result = ConfigResult::ParseError;
    out.error = out.used_path.string() + ": " + parse_error;
    return out;
  }

  out.config = std::move(*parsed);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config() {
  std::filesystem::path effective_path{std::string{kConfigPath}};

  std::string user_path = get_user_config_path();
  if (!user_path.empty()) {
    std::error_code ec;
    bool exists = std::filesystem::exists(user_path, ec);
    if (!ec && exists) {
      effective_path = user_path;
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result == ConfigResult::FileNotFound) {
    // Конфиг необязателен
    return Config{};
  }
  if (out.result != ConfigResult::Ok) {
    std::cerr << "[reprompt] Warning: " << out.error << "\n";
    return Config{};
  }

  return out.config;
}

} // namespace reprompt
