#include "xml_compressor.hpp"
#include "block_restorer.hpp"
#include "placeholder.hpp"
#include "utils/log.hpp"
#include "utils/markup.hpp"
#include "utils/text.hpp"
#include <regex>
#include <vector>

namespace {

const std::regex &cdata_open_pattern() {
  static const std::regex pattern{R"(<!\[CDATA\[)", std::regex::icase};
  return pattern;
}

const std::regex &intertag_pattern() {
  static const std::regex pattern{R"(>\s+<)"};
  return pattern;
}

const std::regex &multispace_pattern() {
  static const std::regex pattern{R"(\s+)"};
  return pattern;
}

const std::regex &tag_property_pattern() {
  static const std::regex pattern{R"((\s\w+)\s*=\s*)", std::regex::icase};
  return pattern;
}

} // namespace

XmlCompressor::XmlCompressor(Options opts) : opts(opts) {}

std::string XmlCompressor::compress(const std::string &xml) {
  if (!opts.enabled || xml.empty()) {
    return xml;
  }

  if (contains_placeholder_sigil(xml)) {
    log_warning(std::string("Input contains the reserved sequence '") +
                PLACEHOLDER_SIGIL + "', leaving it uncompressed");
    return xml;
  }

  std::vector<std::string> cdata_blocks;
  std::string result = replace_delimited(
      xml, cdata_open_pattern(), std::string("]]>"),
      [&](const std::smatch &open, const std::string &body,
          const std::string &close) {
        cdata_blocks.push_back(open.str(0) + body + close);
        return make_placeholder(BlockKind::CData, cdata_blocks.size() - 1);
      });

  result = remove_comments(result);
  result = remove_intertag_spaces(result);
  result = remove_spaces_inside_tags(result);

  result = BlockRestorer::restore_category(result, BlockKind::CData,
                                           cdata_blocks);

  return trim(result);
}

std::string XmlCompressor::remove_comments(const std::string &xml) const {
  if (!opts.remove_comments) {
    return xml;
  }
  return strip_comments(xml, false);
}

std::string
XmlCompressor::remove_intertag_spaces(const std::string &xml) const {
  if (!opts.remove_intertag_spaces) {
    return xml;
  }
  return std::regex_replace(xml, intertag_pattern(), "><");
}

std::string
XmlCompressor::remove_spaces_inside_tags(const std::string &xml) const {
  return rewrite_tags(xml, [](const std::string &tag) {
    std::string result = std::regex_replace(tag, multispace_pattern(), " ");
    result = std::regex_replace(result, tag_property_pattern(), "$1=");
    return trim_tag_end(result, false);
  });
}
