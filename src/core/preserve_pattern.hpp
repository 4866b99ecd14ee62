#ifndef PRESERVE_PATTERN_HPP
#define PRESERVE_PATTERN_HPP

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// A user supplied rule marking regions that must survive compression
// untouched. Matches are replaced before any other block is extracted.
class PreservePattern {
private:
  std::string expression_;
  std::regex regex_;
  std::optional<std::string> close_;

  PreservePattern(std::string expression, std::regex regex,
                  std::optional<std::string> close = std::nullopt);

  // A rule whose `open` regex is followed by a body running to the first
  // literal `close`. `expression` is the equivalent single regex.
  static PreservePattern delimited(const std::string &expression,
                                   const std::string &open,
                                   const std::string &close, bool ignore_case);

public:
  // Throws ConfigError when the expression is not a valid ECMAScript regex.
  static PreservePattern compile(const std::string &expression,
                                 bool ignore_case = false);

  // <?php ... ?>
  static PreservePattern php_tags();
  // <% ... %>
  static PreservePattern server_script_tags();
  // <!--# ... -->
  static PreservePattern server_side_includes();

  // One expression per non-empty line.
  static std::vector<PreservePattern> load_file(const fs::path &path);

  const std::string &expression() const { return expression_; }
  // The whole rule, or only its opening marker when close() is set.
  const std::regex &regex() const { return regex_; }
  const std::optional<std::string> &close() const { return close_; }
};

#endif // PRESERVE_PATTERN_HPP
