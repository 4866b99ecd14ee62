#include "preserve_pattern.hpp"
#include "compressor.hpp"
#include <fstream>
#include <utility>

PreservePattern::PreservePattern(std::string expression, std::regex regex,
                                 std::optional<std::string> close)
    : expression_(std::move(expression)), regex_(std::move(regex)),
      close_(std::move(close)) {}

PreservePattern PreservePattern::compile(const std::string &expression,
                                         bool ignore_case) {
  auto flags = std::regex::ECMAScript;
  if (ignore_case) {
    flags |= std::regex::icase;
  }

  try {
    return PreservePattern(expression, std::regex(expression, flags));
  } catch (const std::regex_error &e) {
    throw ConfigError("Regular expression compilation error in '" +
                      expression + "': " + e.what());
  }
}

PreservePattern PreservePattern::delimited(const std::string &expression,
                                           const std::string &open,
                                           const std::string &close,
                                           bool ignore_case) {
  auto flags = std::regex::ECMAScript;
  if (ignore_case) {
    flags |= std::regex::icase;
  }
  return PreservePattern(expression, std::regex(open, flags), close);
}

PreservePattern PreservePattern::php_tags() {
  return delimited(R"(<\?php[\s\S]*?\?>)", R"(<\?php)", "?>", true);
}

PreservePattern PreservePattern::server_script_tags() {
  return delimited(R"(<%[\s\S]*?%>)", "<%", "%>", false);
}

PreservePattern PreservePattern::server_side_includes() {
  return delimited(R"(<!--\s*#[\s\S]*?-->)", R"(<!--\s*#)", "-->", false);
}

std::vector<PreservePattern> PreservePattern::load_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Unable to read custom pattern definitions file: " +
                      path.string());
  }

  std::vector<PreservePattern> patterns;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      patterns.push_back(compile(line));
    }
  }

  return patterns;
}
