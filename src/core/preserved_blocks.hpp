#ifndef PRESERVED_BLOCKS_HPP
#define PRESERVED_BLOCKS_HPP

#include "placeholder.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// Extracted content of one compress() call, in discovery order per category.
// The position of a block in its list is the index in its placeholder.
struct PreservedBlocks {
  // Nesting level of the compression that owns these blocks.
  size_t depth = 0;
  std::unordered_map<BlockKind, std::vector<std::string>> categories;
  std::vector<std::vector<std::string>> user;

  std::vector<std::string> &operator[](BlockKind kind) {
    return categories[kind];
  }

  const std::vector<std::string> &get(BlockKind kind) const {
    static const std::vector<std::string> empty;
    auto it = categories.find(kind);
    return (it != categories.end()) ? it->second : empty;
  }

  size_t count(BlockKind kind) const { return get(kind).size(); }
};

#endif // PRESERVED_BLOCKS_HPP
