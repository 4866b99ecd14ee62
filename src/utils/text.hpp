#ifndef TEXT_HPP
#define TEXT_HPP

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <utility>
#include <vector>

inline bool is_space(char c) {
  return static_cast<unsigned char>(c) <= ' ';
}

inline std::string trim(const std::string &str) {
  size_t start = 0;
  while (start < str.length() && is_space(str[start])) {
    start++;
  }
  size_t end = str.length();
  while (end > start && is_space(str[end - 1])) {
    end--;
  }
  return str.substr(start, end - start);
}

inline bool is_blank(const std::string &str) {
  return std::all_of(str.begin(), str.end(), is_space);
}

inline std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

inline bool equals_ignore_case(const std::string &a, const std::string &b) {
  return a.length() == b.length() && to_lower(a) == to_lower(b);
}

inline std::vector<std::string> split_list(const std::string &list,
                                           char delimiter = ',') {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= list.length()) {
    size_t end = list.find(delimiter, start);
    if (end == std::string::npos) {
      end = list.length();
    }
    std::string item = trim(list.substr(start, end - start));
    if (!item.empty()) {
      items.push_back(item);
    }
    start = end + 1;
  }
  return items;
}

inline size_t find_ignore_case(const std::string &haystack,
                               const std::string &needle, size_t pos = 0) {
  if (pos > haystack.length()) {
    return std::string::npos;
  }
  auto it = std::search(haystack.begin() + pos, haystack.end(), needle.begin(),
                        needle.end(), [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                        });
  if (it == haystack.end() && !needle.empty()) {
    return std::string::npos;
  }
  return it - haystack.begin();
}

// Rebuilds `input`, substituting every match of `pattern` with the string
// returned by `replace`. Returning match.str(0) keeps a match as it is.
template <typename Replace>
std::string replace_matches(const std::string &input, const std::regex &pattern,
                            Replace &&replace) {
  std::string result;
  result.reserve(input.length());

  auto last = input.cbegin();
  for (std::sregex_iterator it(input.cbegin(), input.cend(), pattern), end;
       it != end; ++it) {
    const std::smatch &match = *it;
    result.append(last, match[0].first);
    result += replace(match);
    last = match[0].second;
  }
  result.append(last, input.cend());

  return result;
}

// Position and length of the closing delimiter of a span, npos if absent.
using Delimiter = std::pair<size_t, size_t>;

inline Delimiter find_delimiter(const std::string &input, size_t from,
                                const std::string &close) {
  return {find_ignore_case(input, close, from), close.length()};
}

inline Delimiter find_delimiter(const std::string &input, size_t from,
                                const std::regex &close) {
  std::smatch match;
  if (!std::regex_search(input.cbegin() + from, input.cend(), match, close,
                         std::regex_constants::match_prev_avail)) {
    return {std::string::npos, 0};
  }
  return {from + match.position(0), static_cast<size_t>(match.length(0))};
}

// Like replace_matches for spans whose body can be arbitrarily long. Only the
// opening marker is matched by `open`; the body runs up to the first `close`
// (a string compared case-insensitively or a regex) after it. `replace`
// receives the opening match, the body and the closing text.
template <typename Close, typename Replace>
std::string replace_delimited(const std::string &input, const std::regex &open,
                              const Close &close, Replace &&replace) {
  std::string result;
  result.reserve(input.length());

  auto last = input.cbegin();
  auto flags = std::regex_constants::match_default;
  std::smatch match;
  while (std::regex_search(last, input.cend(), match, open, flags)) {
    size_t body_begin = match[0].second - input.cbegin();
    auto [close_begin, close_length] = find_delimiter(input, body_begin, close);
    if (close_begin == std::string::npos) {
      break;
    }

    result.append(last, match[0].first);
    result += replace(match,
                      input.substr(body_begin, close_begin - body_begin),
                      input.substr(close_begin, close_length));
    last = input.cbegin() + close_begin + close_length;
    flags = std::regex_constants::match_prev_avail;
  }
  result.append(last, input.cend());

  return result;
}

// Replaces the last match of `pattern` in `text`.
template <typename Replace>
std::string replace_last_match(const std::string &text,
                               const std::regex &pattern, Replace &&replace) {
  std::smatch last;
  for (std::sregex_iterator it(text.cbegin(), text.cend(), pattern), end;
       it != end; ++it) {
    last = *it;
  }
  if (last.empty()) {
    return text;
  }
  return std::string(text.cbegin(), last[0].first) + replace(last) +
         std::string(last[0].second, text.cend());
}

#endif // TEXT_HPP
