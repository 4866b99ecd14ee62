#include "statistics.hpp"
#include <cctype>
#include <sstream>

std::string HtmlMetrics::to_string() const {
  std::ostringstream out;
  out << "Filesize=" << filesize << ", Empty Chars=" << empty_chars
      << ", Script Size=" << inline_script_size
      << ", Style Size=" << inline_style_size
      << ", Event Handler Size=" << inline_event_size;
  return out.str();
}

std::string HtmlCompressorStatistics::to_string() const {
  std::ostringstream out;
  out << "Time=" << time_ms << ", Preserved=" << preserved_size
      << ", Original={" << original.to_string() << "}, Compressed={"
      << compressed.to_string() << "}";
  return out.str();
}

size_t count_whitespace(const std::string &text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      count++;
    }
  }
  return count;
}

void to_json(nlohmann::json &j, const HtmlMetrics &metrics) {
  j = nlohmann::json{{"filesize", metrics.filesize},
                     {"empty_chars", metrics.empty_chars},
                     {"inline_script_size", metrics.inline_script_size},
                     {"inline_style_size", metrics.inline_style_size},
                     {"inline_event_size", metrics.inline_event_size}};
}

void to_json(nlohmann::json &j, const HtmlCompressorStatistics &stats) {
  j = nlohmann::json{{"time_ms", stats.time_ms},
                     {"preserved_size", stats.preserved_size},
                     {"original", stats.original},
                     {"compressed", stats.compressed}};
}
