#ifndef BASIC_MINIFIERS_HPP
#define BASIC_MINIFIERS_HPP

#include "compressor.hpp"
#include <string>

// Dependency-free fallbacks used when script or style compression is
// requested without a dedicated minifier. They only drop comments and
// redundant whitespace; strings and JavaScript regex literals are copied.
class CssMinifier : public Compressor {
public:
  std::string compress(const std::string &css) override;
};

class JsMinifier : public Compressor {
public:
  std::string compress(const std::string &js) override;

private:
  static bool is_word_char(char c);
  // Whether a '/' after `output` starts a regex literal.
  static bool regex_allowed(const std::string &output);
  static bool needs_separator(char last, char next);
};

#endif // BASIC_MINIFIERS_HPP
