/**
 * @file line_cleaner.cpp
 * @brief Реализация классификатора строк
 */

#include "reprompt/line_cleaner.hpp"
#include "reprompt/utf8.hpp"

#include <algorithm>

namespace reprompt {

namespace {

inline constexpr char kEsc = '\x1B';
inline constexpr char kBel = '\x07';

/// Удаляет хвостовые пробелы
[[nodiscard]] std::string_view rtrim(std::string_view sv) noexcept {
  while (!sv.empty() &&
         (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' ||
          sv.back() == '\v' || sv.back() == '\f')) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Ведущие пробелы строки
[[nodiscard]] std::string_view leading_ws(std::string_view sv) noexcept {
  std::size_t n = 0;
  while (n < sv.size() && (sv[n] == ' ' || sv[n] == '\t')) {
    ++n;
  }
  return sv.substr(0, n);
}

/// Смещение начала последнего UTF-8 символа
[[nodiscard]] std::size_t last_char_offset(std::string_view sv) noexcept {
  std::size_t i = sv.size();
  while (i > 0) {
    --i;
    if ((static_cast<unsigned char>(sv[i]) & 0xC0) != 0x80) {
      return i;
    }
  }
  return 0;
}

/// Пропускает строковую последовательность (OSC/DCS/...) до BEL или ST
[[nodiscard]] std::size_t skip_string_sequence(std::string_view line,
                                               std::size_t i) noexcept {
  while (i < line.size()) {
    if (line[i] == kBel) {
      return i + 1;
    }
    if (line[i] == kEsc && i + 1 < line.size() && line[i + 1] == '\\') {
      return i + 2;
    }
    ++i;
  }
  return i;
}

/// Пропускает CSI: параметры 0x30-0x3F, промежуточные 0x20-0x2F, финал
[[nodiscard]] std::size_t skip_csi(std::string_view line,
                                   std::size_t i) noexcept {
  while (i < line.size()) {
    auto c = static_cast<unsigned char>(line[i]);
    if (c >= 0x20 && c <= 0x3F) {
      ++i;
      continue;
    }
    if (c >= 0x40 && c <= 0x7E) {
      return i + 1;
    }
    // Оборванная последовательность: съеденное выбрасываем
    return i;
  }
  return i;
}

[[nodiscard]] bool is_pure_border(std::string_view line) noexcept {
  bool has_rule = false;
  std::size_t pos = 0;
  while (pos < line.size()) {
    char32_t cp = decode_utf8_lossy(line, pos);
    if (is_space(cp)) {
      continue;
    }
    if (!is_box_drawing(cp)) {
      return false;
    }
    if (!is_vertical_only(cp)) {
      has_rule = true;
    }
  }
  return has_rule;
}

} // namespace

std::string strip_ansi_escapes(std::string_view line) {
  if (line.find(kEsc) == std::string_view::npos) {
    return std::string{line};
  }

  std::string out;
  out.reserve(line.size());

  std::size_t i = 0;
  while (i < line.size()) {
    if (line[i] != kEsc) {
      out.push_back(line[i]);
      ++i;
      continue;
    }

    // line[i] == ESC
    if (i + 1 >= line.size()) {
      ++i;
      continue;
    }

    auto next = static_cast<unsigned char>(line[i + 1]);
    if (next == '[') {
      i = skip_csi(line, i + 2);
    } else if (next == ']' || next == 'P' || next == 'X' || next == '^' ||
               next == '_') {
      i = skip_string_sequence(line, i + 2);
    } else if (next >= 0x20 && next <= 0x2F) {
      // ESC ( B и подобные: промежуточные байты + финальный
      i += 2;
      while (i < line.size() && static_cast<unsigned char>(line[i]) >= 0x20 &&
             static_cast<unsigned char>(line[i]) <= 0x2F) {
        ++i;
      }
      if (i < line.size() && static_cast<unsigned char>(line[i]) >= 0x30 &&
          static_cast<unsigned char>(line[i]) <= 0x7E) {
        ++i;
      }
    } else if (next >= 0x30 && next <= 0x7E) {
      i += 2;
    } else {
      // Одиночный ESC
      ++i;
    }
  }

  return out;
}

LineClass classify_line(std::string_view line, const CleanerOptions &options) {
  LineClass result;

  if (is_pure_border(line)) {
    result.kind = LineKind::PureBorder;
    return result;
  }

  const std::size_t lead = leading_ws(line).size();
  if (lead >= line.size()) {
    return result;
  }

  std::size_t pos = lead;
  const char32_t first = decode_utf8_lossy(line, pos);

  bool box_border = false;
  if (is_vertical_border(first)) {
    box_border = true;
  } else if (first == '|' && options.ascii_pipe_borders) {
    const auto pipes =
        static_cast<std::size_t>(std::count(line.begin(), line.end(), '|'));
    // "||" — оператор, а не рамка
    if (pipes >= options.table_pipe_threshold ||
        (pos < line.size() && line[pos] == '|')) {
      return result;
    }
  } else {
    return result;
  }

  std::string_view rest = line.substr(pos);
  if (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }
  rest = rtrim(rest);

  if (!rest.empty()) {
    const std::size_t last = last_char_offset(rest);
    std::size_t p = last;
    const char32_t tail = decode_utf8_lossy(rest, p);

    bool closing = false;
    if (box_border) {
      closing = is_vertical_border(tail);
    } else {
      closing = tail == '|' && (last == 0 || rest[last - 1] != '|');
    }

    if (closing) {
      rest = rtrim(rest.substr(0, last));
    }
  }

  result.kind = LineKind::ContentWrapper;
  result.content = rest;
  result.indent = leading_ws(rest);
  return result;
}

std::optional<std::string> clean_line(std::string_view line,
                                      const CleanerOptions &options) {
  std::string stripped =
      options.strip_ansi ? strip_ansi_escapes(line) : std::string{line};

  // '\r' в конце — остаток перевода строки \r\n
  std::string_view current{stripped};
  while (!current.empty() && current.back() == '\r') {
    current.remove_suffix(1);
  }

  while (true) {
    LineClass cls = classify_line(current, options);
    switch (cls.kind) {
    case LineKind::PureBorder:
      return std::nullopt;
    case LineKind::Plain:
      return std::string{current};
    case LineKind::ContentWrapper:
      // Содержимое строго короче строки — цикл конечен
      current = cls.content;
      break;
    }
  }
}

std::string clean_text(std::string_view text, const CleanerOptions &options) {
  std::string out;
  out.reserve(text.size());

  bool first = true;
  std::size_t start = 0;
  while (true) {
    const std::size_t nl = text.find('\n', start);
    const std::string_view line = nl == std::string_view::npos
                                      ? text.substr(start)
                                      : text.substr(start, nl - start);

    if (auto cleaned = clean_line(line, options)) {
      if (!first) {
        out.push_back('\n');
      }
      out.append(*cleaned);
      first = false;
    }

    if (nl == std::string_view::npos) {
      break;
    }
    start = nl + 1;
  }

  return out;
}

} // namespace reprompt
