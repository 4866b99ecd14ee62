#ifndef BLOCK_RESTORER_HPP
#define BLOCK_RESTORER_HPP

#include "preserved_blocks.hpp"
#include <regex>
#include <string>
#include <vector>

// Puts extracted blocks back in the exact reverse of the extraction order.
// A placeholder whose index has no stored block is left as literal text.
class BlockRestorer {
public:
  static std::string restore(const std::string &skeleton,
                             const PreservedBlocks &blocks);

  static std::string restore_category(const std::string &skeleton,
                                      BlockKind kind,
                                      const std::vector<std::string> &list,
                                      size_t depth = 0);

  static std::string restore_user_rule(const std::string &skeleton,
                                       size_t rule,
                                       const std::vector<std::string> &list,
                                       size_t depth = 0);

private:
  static std::string substitute(const std::string &skeleton,
                                const std::regex &pattern,
                                const std::vector<std::string> &list);
};

#endif // BLOCK_RESTORER_HPP
