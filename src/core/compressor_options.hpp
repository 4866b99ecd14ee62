#ifndef COMPRESSOR_OPTIONS_HPP
#define COMPRESSOR_OPTIONS_HPP

#include "preserve_pattern.hpp"
#include <string>
#include <vector>

// Tags that are very likely to be block-level.
inline constexpr const char *BLOCK_TAGS_MIN = "html,head,body,br,p";

// Block-level tags by default, excluding <div> and <li>; table tags included.
inline constexpr const char *BLOCK_TAGS_MAX =
    "html,head,body,br,p,h1,h2,h3,h4,h5,h6,blockquote,center,dl,fieldset,"
    "form,frame,frameset,hr,noframes,ol,table,tbody,tr,td,th,tfoot,thead,ul";

// Removes spaces around every tag. Not recommended.
inline constexpr const char *ALL_TAGS = "all";

struct HtmlCompressorOptions {
  bool enabled = true;

  bool remove_comments = true;
  bool remove_multi_spaces = true;
  bool remove_spaces_inside_tags = true;

  bool remove_intertag_spaces = false;
  bool remove_quotes = false;
  bool preserve_line_breaks = false;
  bool simple_doctype = false;
  bool remove_script_attributes = false;
  bool remove_style_attributes = false;
  bool remove_link_attributes = false;
  bool remove_form_attributes = false;
  bool remove_input_attributes = false;
  bool simple_boolean_attributes = false;
  bool remove_javascript_protocol = false;
  bool remove_http_protocol = false;
  bool remove_https_protocol = false;

  bool compress_javascript = false;
  bool compress_css = false;

  bool generate_statistics = false;

  // Empty disables the step. Otherwise "min", "max", "all", one of the
  // BLOCK_TAGS_* lists or a custom comma separated list of tag names.
  std::string remove_surrounding_spaces;

  std::vector<PreservePattern> preserve_patterns;
};

struct XmlCompressorOptions {
  bool enabled = true;
  bool remove_comments = true;
  bool remove_intertag_spaces = true;
};

#endif // COMPRESSOR_OPTIONS_HPP
