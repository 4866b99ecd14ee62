#include "placeholder.hpp"

const char *block_kind_tag(BlockKind kind) {
  switch (kind) {
  case BlockKind::User:
    return "USER";
  case BlockKind::Skip:
    return "SKIP";
  case BlockKind::CondComment:
    return "COND";
  case BlockKind::Event:
    return "EVENT";
  case BlockKind::Pre:
    return "PRE";
  case BlockKind::Script:
    return "SCRIPT";
  case BlockKind::Style:
    return "STYLE";
  case BlockKind::TextArea:
    return "TEXTAREA";
  case BlockKind::LineBreak:
    return "LT";
  case BlockKind::CData:
    return "CDATA";
  }
  return "UNKNOWN";
}

std::string placeholder_prefix(size_t depth) {
  std::string prefix = PLACEHOLDER_SIGIL;
  if (depth > 0) {
    prefix += std::to_string(depth);
  }
  return prefix + "~";
}

std::string make_placeholder(BlockKind kind, size_t index, size_t depth) {
  return placeholder_prefix(depth) + block_kind_tag(kind) + "~" +
         std::to_string(index) + PLACEHOLDER_SUFFIX;
}

std::string make_user_placeholder(size_t rule, size_t index, size_t depth) {
  return placeholder_prefix(depth) + "USER" + std::to_string(rule) + "~" +
         std::to_string(index) + PLACEHOLDER_SUFFIX;
}

std::regex placeholder_pattern(BlockKind kind, size_t depth) {
  return std::regex(placeholder_prefix(depth) + block_kind_tag(kind) +
                    "~(\\d+)" + PLACEHOLDER_SUFFIX);
}

std::regex user_placeholder_pattern(size_t rule, size_t depth) {
  return std::regex(placeholder_prefix(depth) + "USER" + std::to_string(rule) +
                    "~(\\d+)" + PLACEHOLDER_SUFFIX);
}

bool contains_placeholder_sigil(const std::string &text) {
  return text.find(PLACEHOLDER_SIGIL) != std::string::npos;
}
