#ifndef PLACEHOLDER_HPP
#define PLACEHOLDER_HPP

#include <cstddef>
#include <regex>
#include <string>

// Categories of preserved content. Each one owns a placeholder namespace and
// an ordered block list.
enum class BlockKind {
  User,
  Skip,
  CondComment,
  Event,
  Pre,
  Script,
  Style,
  TextArea,
  LineBreak,
  CData
};

// Placeholders look like %%%~COMPRESS~PRE~3~%%%. Compressions nested inside
// conditional comments carry their depth in the prefix (%%%~COMPRESS1~...)
// so they never resolve the placeholders of the enclosing document.
//
// The sigil is assumed never to appear in real markup; inputs that contain it
// are not compressed.
inline constexpr const char *PLACEHOLDER_SIGIL = "%%%~COMPRESS";
inline constexpr const char *PLACEHOLDER_SUFFIX = "~%%%";

const char *block_kind_tag(BlockKind kind);

std::string placeholder_prefix(size_t depth = 0);

std::string make_placeholder(BlockKind kind, size_t index, size_t depth = 0);
std::string make_user_placeholder(size_t rule, size_t index,
                                  size_t depth = 0);

// Group 1 of these patterns captures the block index.
std::regex placeholder_pattern(BlockKind kind, size_t depth = 0);
std::regex user_placeholder_pattern(size_t rule, size_t depth = 0);

bool contains_placeholder_sigil(const std::string &text);

#endif // PLACEHOLDER_HPP
