/**
 * @file mojibake.cpp
 * @brief Реализация детектора и восстановления mojibake
 */

#include "reprompt/mojibake.hpp"
#include "reprompt/utf8.hpp"

#include <array>
#include <vector>

namespace reprompt {

namespace {

/// Windows-1252: байты 0x80 - 0x9F (остальные совпадают с Latin-1)
inline constexpr std::array<char32_t, 32> kCp1252High = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, // 80-87
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F, // 88-8F
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014, // 90-97
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178, // 98-9F
};

/// Участок не-ASCII символов, представимых в Windows-1252
struct EncodableRun {
  std::size_t begin = 0; // Байтовые смещения внутри строки
  std::size_t end = 0;
  std::string bytes; // Образ участка в Windows-1252
};

[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (true) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

[[nodiscard]] bool is_blank(std::string_view line) noexcept {
  for (char c : line) {
    if (c != ' ' && c != '\t' && c != '\r') {
      return false;
    }
  }
  return true;
}

[[nodiscard]] std::vector<EncodableRun> find_runs(std::string_view line) {
  std::vector<EncodableRun> runs;
  std::optional<EncodableRun> current;

  std::size_t pos = 0;
  while (pos < line.size()) {
    const std::size_t start = pos;
    const char32_t cp = decode_utf8_lossy(line, pos);

    std::optional<unsigned char> byte;
    if (cp >= 0x80) {
      byte = cp1252_encode(cp);
    }

    if (byte) {
      if (!current) {
        current = EncodableRun{start, start, {}};
      }
      current->bytes.push_back(static_cast<char>(*byte));
      current->end = pos;
    } else if (current) {
      runs.push_back(std::move(*current));
      current.reset();
    }
  }

  if (current) {
    runs.push_back(std::move(*current));
  }
  return runs;
}

/// Содержит ли байтовый образ полную последовательность UTF-8 длиной от
/// min_len байт
[[nodiscard]] bool contains_utf8_sequence(std::string_view bytes,
                                          std::size_t min_len) noexcept {
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (utf8_char_len(static_cast<unsigned char>(bytes[i])) < min_len) {
      continue;
    }
    std::size_t pos = i;
    if (decode_utf8(bytes, pos)) {
      return true;
    }
  }
  return false;
}

/**
 * Маркер повреждения: участок, в образе которого есть 3-4 байтовая
 * последовательность (псевдографика E2 94/95 xx, типографика E2 80 xx,
 * эмодзи). Двухбайтовые совпадения вроде «ß“» (DF 93) встречаются в обычном
 * немецком и французском тексте и маркером не считаются.
 */
[[nodiscard]] bool is_marker_run(const EncodableRun &run) noexcept {
  return contains_utf8_sequence(run.bytes, 3);
}

[[nodiscard]] bool line_has_marker(std::string_view line) {
  for (const auto &run : find_runs(line)) {
    if (is_marker_run(run)) {
      return true;
    }
  }
  return false;
}

struct LineStats {
  std::size_t lines = 0;
  std::size_t corrupted = 0;

  [[nodiscard]] double score() const noexcept {
    if (lines == 0)
      return 0.0;
    return static_cast<double>(corrupted) / static_cast<double>(lines);
  }
};

[[nodiscard]] LineStats scan(std::string_view text) {
  LineStats stats;
  for (auto line : split_lines(text)) {
    if (is_blank(line)) {
      continue;
    }
    ++stats.lines;
    if (line_has_marker(line)) {
      ++stats.corrupted;
    }
  }
  return stats;
}

/**
 * Снимает один слой: на строках с маркером каждый участок, чей образ содержит
 * многобайтовую последовательность, заменяется своим образом. Строки без
 * маркеров не трогаются. nullopt, если образ маркера не является UTF-8.
 */
[[nodiscard]] std::optional<std::string> recover_layer(std::string_view text) {
  std::string repaired;
  repaired.reserve(text.size());

  bool first = true;
  for (auto line : split_lines(text)) {
    if (!first) {
      repaired.push_back('\n');
    }
    first = false;

    if (!line_has_marker(line)) {
      repaired.append(line);
      continue;
    }

    std::size_t copied = 0;
    for (const auto &run : find_runs(line)) {
      if (!contains_utf8_sequence(run.bytes, 2)) {
        // Обычный Latin-1 текст («café») не трогаем
        continue;
      }
      if (!is_valid_utf8(run.bytes)) {
        if (is_marker_run(run)) {
          return std::nullopt;
        }
        continue;
      }
      repaired.append(line.substr(copied, run.begin - copied));
      repaired.append(run.bytes);
      copied = run.end;
    }
    repaired.append(line.substr(copied));
  }

  return repaired;
}

} // namespace

char32_t cp1252_decode(unsigned char byte) noexcept {
  if (byte >= 0x80 && byte <= 0x9F) {
    return kCp1252High[byte - 0x80];
  }
  return byte;
}

std::optional<unsigned char> cp1252_encode(char32_t cp) noexcept {
  // ASCII, Latin-1 и управляющие C1 (их оставляют декодеры Latin-1 и Windows
  // для неопределённых позиций) кодируются сами в себя
  if (cp <= 0xFF) {
    return static_cast<unsigned char>(cp);
  }
  for (std::size_t i = 0; i < kCp1252High.size(); ++i) {
    if (kCp1252High[i] == cp) {
      return static_cast<unsigned char>(0x80 + i);
    }
  }
  return std::nullopt;
}

double mojibake_score(std::string_view text) { return scan(text).score(); }

MojibakeVerdict detect_and_recover(std::string_view text, double min_score) {
  MojibakeVerdict verdict;
  verdict.box_chars_before = count_box_drawing(text);
  verdict.box_chars_after = verdict.box_chars_before;

  const LineStats before = scan(text);
  verdict.corrupted_lines = before.corrupted;
  verdict.score = before.score();
  verdict.score_after = verdict.score;

  if (before.corrupted == 0 || verdict.score < min_score) {
    verdict.status = MojibakeVerdict::Status::Clean;
    return verdict;
  }

  // Текст мог пройти через неверную кодировку несколько раз: снимаем слои,
  // пока маркеры не исчезнут. Каждый настоящий слой укорачивает текст.
  std::string current{text};
  LineStats current_stats = before;
  while (verdict.layers < kMaxMojibakeLayers && current_stats.corrupted > 0) {
    auto repaired = recover_layer(current);
    if (!repaired || repaired->size() >= current.size() ||
        !is_valid_utf8(*repaired)) {
      break;
    }

    current = std::move(*repaired);
    current_stats = scan(current);
    ++verdict.layers;
  }

  if (verdict.layers == 0 || !(current_stats.score() < verdict.score)) {
    verdict.status = MojibakeVerdict::Status::Unrecoverable;
    return verdict;
  }

  verdict.status = MojibakeVerdict::Status::Recovered;
  verdict.score_after = current_stats.score();
  verdict.box_chars_after = count_box_drawing(current);
  verdict.text = std::move(current);
  return verdict;
}

} // namespace reprompt
