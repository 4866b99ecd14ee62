#ifndef STATISTICS_HPP
#define STATISTICS_HPP

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

struct HtmlMetrics {
  size_t filesize = 0;
  size_t empty_chars = 0;
  size_t inline_script_size = 0;
  size_t inline_style_size = 0;
  size_t inline_event_size = 0;

  std::string to_string() const;
};

// Filled by HtmlCompressor when generate_statistics is on. Shared by every
// call on the same compressor, so such a compressor must not be used from
// several threads at once.
struct HtmlCompressorStatistics {
  HtmlMetrics original;
  HtmlMetrics compressed;
  int64_t time_ms = 0;
  size_t preserved_size = 0;

  std::string to_string() const;
};

size_t count_whitespace(const std::string &text);

void to_json(nlohmann::json &j, const HtmlMetrics &metrics);
void to_json(nlohmann::json &j, const HtmlCompressorStatistics &stats);

#endif // STATISTICS_HPP
