#ifndef SKELETON_TRANSFORMER_HPP
#define SKELETON_TRANSFORMER_HPP

#include "compressor_options.hpp"
#include <string>
#include <unordered_set>

// Rewrites the placeholder-laden skeleton of a document. Every step is a
// pure string-to-string function gated by its own option; transform() runs
// them in a fixed order.
class SkeletonTransformer {
public:
  // Throws ConfigError when remove_surrounding_spaces names no tag.
  explicit SkeletonTransformer(HtmlCompressorOptions opts);

  std::string transform(const std::string &html) const;

  std::string remove_comments(const std::string &html) const;
  std::string simple_doctype(const std::string &html) const;
  std::string remove_script_attributes(const std::string &html) const;
  std::string remove_style_attributes(const std::string &html) const;
  std::string remove_link_attributes(const std::string &html) const;
  std::string remove_form_attributes(const std::string &html) const;
  std::string remove_input_attributes(const std::string &html) const;
  std::string simple_boolean_attributes(const std::string &html) const;
  std::string remove_http_protocol(const std::string &html) const;
  std::string remove_https_protocol(const std::string &html) const;
  std::string remove_intertag_spaces(const std::string &html) const;
  std::string remove_multi_spaces(const std::string &html) const;
  std::string remove_spaces_inside_tags(const std::string &html) const;
  std::string remove_quotes_inside_tags(const std::string &html) const;
  std::string remove_surrounding_spaces(const std::string &html) const;

  // Lower-cased tag names for `min`, `max` or a comma-separated list.
  static std::unordered_set<std::string>
  surrounding_spaces_tags(const std::string &tags);

private:
  bool removes_surrounding_spaces(const std::string &tag) const;

  HtmlCompressorOptions opts;
  bool surround_all_tags = false;
  std::unordered_set<std::string> surrounding_tags;
};

#endif // SKELETON_TRANSFORMER_HPP
