#ifndef MARKUP_HPP
#define MARKUP_HPP

#include "text.hpp"
#include <optional>
#include <string>

// A `<...>` span of a document. A '<' followed by another '<' before any '>'
// is text. Comments run to their `-->`.
struct TagSpan {
  size_t begin;
  size_t end;
  bool comment;
};

inline std::optional<TagSpan> find_tag(const std::string &html, size_t pos) {
  while (true) {
    size_t open = html.find('<', pos);
    if (open == std::string::npos) {
      return std::nullopt;
    }

    if (html.compare(open, 4, "<!--") == 0) {
      size_t close = html.find("-->", open + 4);
      if (close != std::string::npos) {
        return TagSpan{open, close + 3, true};
      }
    }

    size_t close = html.find_first_of("<>", open + 1);
    if (close == std::string::npos) {
      return std::nullopt;
    }
    if (html[close] == '>') {
      return TagSpan{open, close + 1, false};
    }
    pos = close;
  }
}

// Removes `<!-- ... -->` comments. With `keep_conditional`, comments opening
// with `<!--[` stay, while the empty `<!---->` still goes.
inline std::string strip_comments(const std::string &html,
                                  bool keep_conditional) {
  std::string result;
  result.reserve(html.length());

  size_t pos = 0;
  while (true) {
    size_t open = html.find("<!--", pos);
    if (open == std::string::npos) {
      break;
    }

    size_t body = open + 4;
    if (keep_conditional) {
      if (html.compare(open, 7, "<!---->") == 0) {
        result.append(html, pos, open - pos);
        pos = open + 7;
        continue;
      }
      if (body < html.length() && html[body] == '[') {
        result.append(html, pos, body - pos);
        pos = body;
        continue;
      }
      body++;
    }

    size_t close = html.find("-->", body);
    if (close == std::string::npos) {
      break;
    }
    result.append(html, pos, open - pos);
    pos = close + 3;
  }
  result.append(html, pos);

  return result;
}

// Lower-cased element name of `tag`, without the '/' of an end tag.
inline std::string tag_name(const std::string &tag) {
  size_t start = 1;
  if (start < tag.length() && tag[start] == '/') {
    start++;
  }
  size_t end = start;
  while (end < tag.length() && !is_space(tag[end]) && tag[end] != '/' &&
         tag[end] != '>') {
    end++;
  }
  return to_lower(tag.substr(start, end - start));
}

// Applies `rewrite` to every tag of `html`. Text and comments are copied.
template <typename Rewrite>
std::string rewrite_tags(const std::string &html, Rewrite &&rewrite) {
  std::string result;
  result.reserve(html.length());

  size_t pos = 0;
  while (auto tag = find_tag(html, pos)) {
    result.append(html, pos, tag->begin - pos);
    std::string markup = html.substr(tag->begin, tag->end - tag->begin);
    result += tag->comment ? markup : rewrite(markup);
    pos = tag->end;
  }
  result.append(html, pos);

  return result;
}

inline bool ends_with_unquoted_value(const std::string &text) {
  size_t i = text.length();
  while (i > 0 && (std::isalnum(static_cast<unsigned char>(text[i - 1])) ||
                   text[i - 1] == '-' || text[i - 1] == '_')) {
    i--;
  }
  if (i == text.length()) {
    return false;
  }
  while (i > 0 && is_space(text[i - 1])) {
    i--;
  }
  return i > 0 && text[i - 1] == '=';
}

// Drops whitespace before the closing `>` or `/>` of `tag`. With
// `keep_unquoted_slash`, <a href=x /> keeps its space so the slash is not
// read as part of the value.
inline std::string trim_tag_end(const std::string &tag,
                                bool keep_unquoted_slash) {
  if (tag.length() < 3 || tag.back() != '>') {
    return tag;
  }

  size_t close = tag.length() - 1;
  if (tag[close - 1] == '/') {
    close--;
  }
  size_t keep = close;
  while (keep > 2 && is_space(tag[keep - 1])) {
    keep--;
  }
  if (keep == close) {
    return tag;
  }

  std::string head = tag.substr(0, keep);
  std::string tail = tag.substr(close);
  if (keep_unquoted_slash && tail.front() == '/' &&
      ends_with_unquoted_value(head)) {
    return head + " " + tail;
  }
  return head + tail;
}

#endif // MARKUP_HPP
