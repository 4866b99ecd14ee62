#include "block_restorer.hpp"
#include "block_extractor.hpp"
#include "utils/text.hpp"
#include <stdexcept>

std::string BlockRestorer::restore(const std::string &skeleton,
                                   const PreservedBlocks &blocks) {
  std::string result = skeleton;

  const auto &order = BlockExtractor::pass_order();
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    if (*it != BlockKind::User) {
      result = restore_category(result, *it, blocks.get(*it), blocks.depth);
      continue;
    }
    for (size_t rule = blocks.user.size(); rule > 0; rule--) {
      result = restore_user_rule(result, rule - 1, blocks.user[rule - 1],
                                 blocks.depth);
    }
  }

  return result;
}

std::string
BlockRestorer::restore_category(const std::string &skeleton, BlockKind kind,
                                const std::vector<std::string> &list,
                                size_t depth) {
  if (list.empty()) {
    return skeleton;
  }
  return substitute(skeleton, placeholder_pattern(kind, depth), list);
}

std::string
BlockRestorer::restore_user_rule(const std::string &skeleton, size_t rule,
                                 const std::vector<std::string> &list,
                                 size_t depth) {
  if (list.empty()) {
    return skeleton;
  }
  return substitute(skeleton, user_placeholder_pattern(rule, depth), list);
}

std::string BlockRestorer::substitute(const std::string &skeleton,
                                      const std::regex &pattern,
                                      const std::vector<std::string> &list) {
  return replace_matches(skeleton, pattern, [&](const std::smatch &match) {
    size_t index = 0;
    try {
      index = std::stoul(match.str(1));
    } catch (const std::out_of_range &) {
      return match.str(0);
    }
    if (index >= list.size()) {
      return match.str(0);
    }
    return list[index];
  });
}
