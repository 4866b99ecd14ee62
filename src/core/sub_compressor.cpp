#include "sub_compressor.hpp"
#include "utils/log.hpp"
#include "utils/text.hpp"
#include <optional>
#include <string>
#include <utility>

namespace {

constexpr const char *CDATA_OPEN = "<![CDATA[";
constexpr const char *CDATA_CLOSE = "]]>";

// Body of a block that is a single CDATA section, give or take surrounding
// whitespace.
std::optional<std::string> cdata_body(const std::string &block) {
  std::string section = trim(block);
  size_t open = std::char_traits<char>::length(CDATA_OPEN);
  size_t close = std::char_traits<char>::length(CDATA_CLOSE);
  if (section.length() < open + close ||
      !equals_ignore_case(section.substr(0, open), CDATA_OPEN) ||
      section.compare(section.length() - close, close, CDATA_CLOSE) != 0) {
    return std::nullopt;
  }
  return section.substr(open, section.length() - open - close);
}

} // namespace

SubCompressor::SubCompressor(std::string label,
                             std::shared_ptr<Compressor> compressor)
    : label(std::move(label)), compressor(std::move(compressor)) {}

std::string SubCompressor::compress(const std::string &block) const {
  if (!compressor) {
    return block;
  }

  std::optional<std::string> cdata = cdata_body(block);
  std::string source = cdata ? *cdata : block;

  std::string result;
  try {
    result = compressor->compress(source);
  } catch (const std::exception &e) {
    log_warning(label + " compression failed, block left unminified: " +
                e.what());
    return block;
  }

  if (cdata) {
    result = CDATA_OPEN + result + CDATA_CLOSE;
  }

  return result;
}

void SubCompressor::compress_all(std::vector<std::string> &blocks) const {
  if (blocks.empty()) {
    return;
  }
  if (!compressor) {
    log_warning(label + " compressor is not available, " +
                std::to_string(blocks.size()) + " block(s) left unminified");
    return;
  }

  for (auto &block : blocks) {
    block = compress(block);
  }
}
