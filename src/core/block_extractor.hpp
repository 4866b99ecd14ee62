#ifndef BLOCK_EXTRACTOR_HPP
#define BLOCK_EXTRACTOR_HPP

#include "compressor_options.hpp"
#include "preserved_blocks.hpp"
#include <functional>
#include <string>
#include <vector>

// Replaces protected regions of a document with placeholders. Passes run in
// pass_order(), each one scanning the output of the previous pass, so
// placeholders left by an earlier pass are opaque to the later ones.
class BlockExtractor {
public:
  // Compresses the body of a conditional comment.
  using NestedCompressor = std::function<std::string(const std::string &)>;

  explicit BlockExtractor(HtmlCompressorOptions opts,
                          NestedCompressor nested = nullptr);

  static const std::vector<BlockKind> &pass_order();

  std::string extract(const std::string &html, PreservedBlocks &blocks) const;

  std::string run_pass(BlockKind kind, const std::string &html,
                       PreservedBlocks &blocks) const;

private:
  HtmlCompressorOptions opts;
  NestedCompressor nested_compressor;

  std::string extract_user_blocks(const std::string &html,
                                  PreservedBlocks &blocks) const;
  std::string extract_skip_blocks(const std::string &html,
                                  PreservedBlocks &blocks) const;
  std::string extract_cond_comments(const std::string &html,
                                    PreservedBlocks &blocks) const;
  std::string extract_events(const std::string &html,
                             PreservedBlocks &blocks) const;
  std::string extract_scripts(const std::string &html,
                              PreservedBlocks &blocks) const;
  std::string extract_line_breaks(const std::string &html,
                                  PreservedBlocks &blocks) const;
  std::string extract_tag_bodies(const std::string &html,
                                 const std::regex &open,
                                 const std::string &close, BlockKind kind,
                                 PreservedBlocks &blocks) const;
};

#endif // BLOCK_EXTRACTOR_HPP
