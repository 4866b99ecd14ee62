#include "basic_minifiers.hpp"
#include "utils/text.hpp"
#include <cctype>
#include <unordered_set>

namespace {

bool is_css_punctuation(char c) {
  return c == '{' || c == '}' || c == ';' || c == ',' || c == '>' || c == '~';
}

bool is_css_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Whether a run of whitespace between `result` and `next` can go.
bool drops_css_space(const std::string &result, char next) {
  if (result.empty() || is_css_punctuation(next)) {
    return true;
  }
  char last = result.back();
  if (is_css_punctuation(last)) {
    return true;
  }
  // color: red
  return last == ':' && result.length() > 1 &&
         is_css_name_char(result[result.length() - 2]);
}

} // namespace

std::string CssMinifier::compress(const std::string &css) {
  std::string result;
  result.reserve(css.length());

  char quote = '\0';
  bool pending_space = false;
  size_t i = 0;
  const size_t len = css.length();

  while (i < len) {
    char c = css[i];

    if (quote != '\0') {
      result += c;
      if (c == '\\' && i + 1 < len) {
        result += css[i + 1];
        i += 2;
        continue;
      }
      if (c == quote) {
        quote = '\0';
      }
      i++;
      continue;
    }

    if (c == '/' && i + 1 < len && css[i + 1] == '*') {
      size_t end = css.find("*/", i + 2);
      i = (end == std::string::npos) ? len : end + 2;
      continue;
    }

    if (is_space(c)) {
      pending_space = true;
      i++;
      continue;
    }

    if (pending_space && !drops_css_space(result, c)) {
      result += ' ';
    }
    pending_space = false;

    if (c == '}' && !result.empty() && result.back() == ';') {
      result.pop_back();
    }
    if (c == '"' || c == '\'') {
      quote = c;
    }
    result += c;
    i++;
  }

  return result;
}

bool JsMinifier::is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool JsMinifier::regex_allowed(const std::string &output) {
  static const std::unordered_set<std::string> keywords = {
      "return", "typeof", "case", "do", "else", "in",
      "new", "delete", "void", "throw", "instanceof"};

  size_t end = output.length();
  while (end > 0 && is_space(output[end - 1])) {
    end--;
  }
  if (end == 0) {
    return true;
  }

  char last = output[end - 1];
  if (!is_word_char(last)) {
    return std::string("(,=:[!&|?{};+-*%<>~^").find(last) != std::string::npos;
  }
  size_t start = end;
  while (start > 0 && is_word_char(output[start - 1])) {
    start--;
  }
  return keywords.count(output.substr(start, end - start)) > 0;
}

bool JsMinifier::needs_separator(char last, char next) {
  if (is_word_char(last) && is_word_char(next)) {
    return true;
  }
  // a + +b, a - -b
  return (last == '+' || last == '-') && last == next;
}

std::string JsMinifier::compress(const std::string &js) {
  std::string result;
  result.reserve(js.length());

  char quote = '\0';
  size_t i = 0;
  const size_t len = js.length();

  while (i < len) {
    char c = js[i];
    char next = (i + 1 < len) ? js[i + 1] : '\0';

    if (quote != '\0') {
      result += c;
      if (c == '\\' && i + 1 < len) {
        result += next;
        i += 2;
        continue;
      }
      if (c == quote) {
        quote = '\0';
      }
      i++;
      continue;
    }

    if (c == '"' || c == '\'' || c == '`') {
      quote = c;
      result += c;
      i++;
      continue;
    }

    if (c == '/' && next == '*') {
      size_t end = js.find("*/", i + 2);
      i = (end == std::string::npos) ? len : end + 2;
      continue;
    }

    if (c == '/' && next == '/') {
      while (i < len && js[i] != '\n' && js[i] != '\r') {
        i++;
      }
      continue;
    }

    if (c == '/' && regex_allowed(result)) {
      bool in_class = false;
      result += c;
      i++;
      while (i < len && js[i] != '\n') {
        char r = js[i++];
        result += r;
        if (r == '\\' && i < len) {
          result += js[i++];
        } else if (r == '[') {
          in_class = true;
        } else if (r == ']') {
          in_class = false;
        } else if (r == '/' && !in_class) {
          break;
        }
      }
      continue;
    }

    if (is_space(c)) {
      bool has_newline = false;
      while (i < len && is_space(js[i])) {
        has_newline = has_newline || js[i] == '\n';
        i++;
      }
      if (result.empty() || i >= len) {
        continue;
      }

      char last = result.back();
      char following = js[i];
      if (has_newline && last != ';' && last != '{' && last != '}' &&
          last != ',' && last != '(' && following != '}' && following != ')' &&
          following != ';') {
        // line terminators may end a statement
        result += '\n';
      } else if (needs_separator(last, following)) {
        result += ' ';
      }
      continue;
    }

    result += c;
    i++;
  }

  return trim(result);
}
