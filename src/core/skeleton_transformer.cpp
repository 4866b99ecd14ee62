#include "skeleton_transformer.hpp"
#include "compressor.hpp"
#include "utils/markup.hpp"
#include "utils/text.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace {

constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

const std::regex &doctype_pattern() {
  static const std::regex pattern{R"(<!DOCTYPE[^>]*>)", ICASE};
  return pattern;
}

// The attribute patterns below are matched inside a single tag.

const std::regex &js_type_attr_pattern() {
  static const std::regex pattern{
      R"re(type\s*=\s*(["']*)(?:text|application)/javascript\1)re", ICASE};
  return pattern;
}

const std::regex &js_lang_attr_pattern() {
  static const std::regex pattern{
      R"re(language\s*=\s*(["']*)javascript\1)re", ICASE};
  return pattern;
}

const std::regex &style_type_attr_pattern() {
  static const std::regex pattern{R"re(type\s*=\s*(["']*)text/css\1)re",
                                  ICASE};
  return pattern;
}

const std::regex &link_type_attr_pattern() {
  static const std::regex pattern{
      R"re(type\s*=\s*(["']*)text/(?:css|plain)\1)re", ICASE};
  return pattern;
}

const std::regex &link_rel_attr_pattern() {
  static const std::regex pattern{
      R"re(rel\s*=\s*(["']*)(?:alternate\s+)?stylesheet\1)re", ICASE};
  return pattern;
}

const std::regex &form_method_attr_pattern() {
  static const std::regex pattern{R"re(method\s*=\s*(["']*)get\1)re",
                                  ICASE};
  return pattern;
}

const std::regex &input_type_attr_pattern() {
  static const std::regex pattern{R"re(type\s*=\s*(["']*)text\1)re", ICASE};
  return pattern;
}

const std::regex &boolean_attr_pattern() {
  static const std::regex pattern{
      R"re((checked|selected|disabled|readonly)\s*=\s*(["']*)\w*\2)re",
      ICASE};
  return pattern;
}

const std::regex &http_protocol_pattern() {
  static const std::regex pattern{
      R"re(((?:href|src|cite|action)\s*=\s*['"])http:(?=//[^>]))re", ICASE};
  return pattern;
}

const std::regex &https_protocol_pattern() {
  static const std::regex pattern{
      R"re(((?:href|src|cite|action)\s*=\s*['"])https:(?=//[^>]))re", ICASE};
  return pattern;
}

const std::regex &rel_external_pattern() {
  static const std::regex pattern{
      R"re(rel\s*=\s*(["']*)(?:alternate\s+)?external\1)re", ICASE};
  return pattern;
}

const std::regex &intertag_tag_tag_pattern() {
  static const std::regex pattern{R"(>\s+<)"};
  return pattern;
}

const std::regex &intertag_tag_placeholder_pattern() {
  static const std::regex pattern{R"(>\s+%%%~)"};
  return pattern;
}

const std::regex &intertag_placeholder_tag_pattern() {
  static const std::regex pattern{R"(~%%%\s+<)"};
  return pattern;
}

const std::regex &intertag_placeholder_placeholder_pattern() {
  static const std::regex pattern{R"(~%%%\s+%%%~)"};
  return pattern;
}

const std::regex &multispace_pattern() {
  static const std::regex pattern{R"(\s+)"};
  return pattern;
}

const std::regex &tag_property_pattern() {
  static const std::regex pattern{R"((\s\w+)\s*=\s*)", ICASE};
  return pattern;
}

bool is_unquotable(const std::string &value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char c) {
           return std::isalnum(c) || c == '-' || c == '_';
         });
}

// Unquotes attribute values made only of [-a-z0-9_] in one tag.
std::string unquote_values(const std::string &tag) {
  std::string result;
  result.reserve(tag.length());

  size_t i = 0;
  while (i < tag.length()) {
    if (tag[i] != '=') {
      result += tag[i++];
      continue;
    }

    size_t quote = i + 1;
    while (quote < tag.length() && is_space(tag[quote])) {
      quote++;
    }
    size_t close = std::string::npos;
    if (quote < tag.length() && (tag[quote] == '"' || tag[quote] == '\'')) {
      close = tag.find(tag[quote], quote + 1);
    }
    std::string value;
    if (close != std::string::npos) {
      value = tag.substr(quote + 1, close - quote - 1);
    }
    if (!is_unquotable(value)) {
      result += tag[i++];
      continue;
    }

    while (!result.empty() && is_space(result.back())) {
      result.pop_back();
    }
    result += "=" + value;
    i = close + 1;
    if (i < tag.length() && tag[i] == '/') {
      result += " /";
      i++;
    }
  }

  return result;
}

// Removes the last match of `attribute` from tags named `name`.
std::string remove_attribute(const std::string &html, const char *name,
                             const std::regex &attribute) {
  return rewrite_tags(html, [&](const std::string &tag) {
    if (tag_name(tag) != name) {
      return tag;
    }
    return replace_last_match(tag, attribute,
                              [](const std::smatch &) { return ""; });
  });
}

// Strips the scheme of the first href/src/cite/action value in each tag
// unless the tag is marked rel="external".
std::string strip_protocol(const std::string &html, const std::regex &pattern) {
  return rewrite_tags(html, [&](const std::string &tag) {
    std::smatch match;
    if (!std::regex_search(tag, match, pattern) ||
        std::regex_search(tag, rel_external_pattern())) {
      return tag;
    }
    return match.prefix().str() + match.str(1) + match.suffix().str();
  });
}

} // namespace

SkeletonTransformer::SkeletonTransformer(HtmlCompressorOptions opts)
    : opts(std::move(opts)) {
  const std::string &tags = this->opts.remove_surrounding_spaces;
  if (equals_ignore_case(tags, ALL_TAGS)) {
    surround_all_tags = true;
  } else if (!tags.empty()) {
    surrounding_tags = surrounding_spaces_tags(tags);
  }
}

std::unordered_set<std::string>
SkeletonTransformer::surrounding_spaces_tags(const std::string &tags) {
  std::string list = tags;
  if (equals_ignore_case(tags, "min")) {
    list = BLOCK_TAGS_MIN;
  } else if (equals_ignore_case(tags, "max")) {
    list = BLOCK_TAGS_MAX;
  }

  std::unordered_set<std::string> names;
  for (const auto &tag : split_list(list)) {
    names.insert(to_lower(tag));
  }
  if (names.empty()) {
    throw ConfigError("No tags given to remove surrounding spaces from: '" +
                      tags + "'");
  }
  return names;
}

bool SkeletonTransformer::removes_surrounding_spaces(
    const std::string &tag) const {
  if (surround_all_tags) {
    return tag.length() > 2;
  }
  return surrounding_tags.count(tag_name(tag)) > 0;
}

std::string SkeletonTransformer::transform(const std::string &html) const {
  std::string result = html;

  result = remove_comments(result);
  result = simple_doctype(result);
  result = remove_script_attributes(result);
  result = remove_style_attributes(result);
  result = remove_link_attributes(result);
  result = remove_form_attributes(result);
  result = remove_input_attributes(result);
  result = simple_boolean_attributes(result);
  result = remove_http_protocol(result);
  result = remove_https_protocol(result);
  result = remove_intertag_spaces(result);
  result = remove_multi_spaces(result);
  result = remove_spaces_inside_tags(result);
  result = remove_quotes_inside_tags(result);
  result = remove_surrounding_spaces(result);

  return trim(result);
}

std::string
SkeletonTransformer::remove_comments(const std::string &html) const {
  if (!opts.remove_comments) {
    return html;
  }
  return strip_comments(html, true);
}

std::string SkeletonTransformer::simple_doctype(const std::string &html) const {
  if (!opts.simple_doctype) {
    return html;
  }
  return std::regex_replace(html, doctype_pattern(), "<!DOCTYPE html>");
}

std::string
SkeletonTransformer::remove_script_attributes(const std::string &html) const {
  if (!opts.remove_script_attributes) {
    return html;
  }
  std::string result = remove_attribute(html, "script", js_type_attr_pattern());
  return remove_attribute(result, "script", js_lang_attr_pattern());
}

std::string
SkeletonTransformer::remove_style_attributes(const std::string &html) const {
  if (!opts.remove_style_attributes) {
    return html;
  }
  return remove_attribute(html, "style", style_type_attr_pattern());
}

std::string
SkeletonTransformer::remove_link_attributes(const std::string &html) const {
  if (!opts.remove_link_attributes) {
    return html;
  }
  return rewrite_tags(html, [](const std::string &tag) {
    if (tag_name(tag) != "link" ||
        !std::regex_search(tag, link_rel_attr_pattern())) {
      return tag;
    }
    return replace_last_match(tag, link_type_attr_pattern(),
                              [](const std::smatch &) { return ""; });
  });
}

std::string
SkeletonTransformer::remove_form_attributes(const std::string &html) const {
  if (!opts.remove_form_attributes) {
    return html;
  }
  return remove_attribute(html, "form", form_method_attr_pattern());
}

std::string
SkeletonTransformer::remove_input_attributes(const std::string &html) const {
  if (!opts.remove_input_attributes) {
    return html;
  }
  return remove_attribute(html, "input", input_type_attr_pattern());
}

std::string
SkeletonTransformer::simple_boolean_attributes(const std::string &html) const {
  if (!opts.simple_boolean_attributes) {
    return html;
  }
  return rewrite_tags(html, [](const std::string &tag) {
    return replace_last_match(tag, boolean_attr_pattern(),
                              [](const std::smatch &match) {
                                return match.str(1);
                              });
  });
}

std::string
SkeletonTransformer::remove_http_protocol(const std::string &html) const {
  if (!opts.remove_http_protocol) {
    return html;
  }
  return strip_protocol(html, http_protocol_pattern());
}

std::string
SkeletonTransformer::remove_https_protocol(const std::string &html) const {
  if (!opts.remove_https_protocol) {
    return html;
  }
  return strip_protocol(html, https_protocol_pattern());
}

std::string
SkeletonTransformer::remove_intertag_spaces(const std::string &html) const {
  if (!opts.remove_intertag_spaces) {
    return html;
  }
  std::string result =
      std::regex_replace(html, intertag_tag_tag_pattern(), "><");
  result = std::regex_replace(result, intertag_tag_placeholder_pattern(),
                              ">%%%~");
  result = std::regex_replace(result, intertag_placeholder_tag_pattern(),
                              "~%%%<");
  return std::regex_replace(result, intertag_placeholder_placeholder_pattern(),
                            "~%%%%%%~");
}

std::string
SkeletonTransformer::remove_multi_spaces(const std::string &html) const {
  if (!opts.remove_multi_spaces) {
    return html;
  }
  return std::regex_replace(html, multispace_pattern(), " ");
}

std::string
SkeletonTransformer::remove_spaces_inside_tags(const std::string &html) const {
  if (!opts.remove_spaces_inside_tags) {
    return html;
  }

  return rewrite_tags(html, [](const std::string &tag) {
    return trim_tag_end(std::regex_replace(tag, tag_property_pattern(), "$1="),
                        true);
  });
}

std::string
SkeletonTransformer::remove_quotes_inside_tags(const std::string &html) const {
  if (!opts.remove_quotes) {
    return html;
  }
  return rewrite_tags(html, unquote_values);
}

std::string
SkeletonTransformer::remove_surrounding_spaces(const std::string &html) const {
  if (!surround_all_tags && surrounding_tags.empty()) {
    return html;
  }

  std::string result;
  result.reserve(html.length());

  size_t pos = 0;
  while (auto tag = find_tag(html, pos)) {
    std::string markup = html.substr(tag->begin, tag->end - tag->begin);
    if (!removes_surrounding_spaces(markup)) {
      result.append(html, pos, tag->end - pos);
      pos = tag->end;
      continue;
    }

    result.append(html, pos, tag->begin - pos);
    while (!result.empty() && is_space(result.back())) {
      result.pop_back();
    }
    result += markup;
    pos = tag->end;
    while (pos < html.length() && is_space(html[pos])) {
      pos++;
    }
  }
  result.append(html, pos);

  return result;
}
