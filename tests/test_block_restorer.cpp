#include "core/block_extractor.hpp"
#include "core/block_restorer.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

TEST(BlockRestorerTest, RestoresCategory) {
  PreservedBlocks blocks;
  blocks[BlockKind::Pre] = {"  x  ", "y"};
  EXPECT_EQ("<pre>  x  </pre><pre>y</pre>",
            BlockRestorer::restore("<pre>%%%~COMPRESS~PRE~0~%%%</pre>"
                                   "<pre>%%%~COMPRESS~PRE~1~%%%</pre>",
                                   blocks));
}

TEST(BlockRestorerTest, OutOfRangeIndexStaysLiteral) {
  PreservedBlocks blocks;
  blocks[BlockKind::Pre] = {"a"};
  EXPECT_EQ("a%%%~COMPRESS~PRE~5~%%%",
            BlockRestorer::restore(
                "%%%~COMPRESS~PRE~0~%%%%%%~COMPRESS~PRE~5~%%%", blocks));
}

TEST(BlockRestorerTest, HugeIndexStaysLiteral) {
  std::string skeleton = "%%%~COMPRESS~PRE~99999999999999999999999~%%%";
  EXPECT_EQ(skeleton, BlockRestorer::restore_category(skeleton, BlockKind::Pre,
                                                      {"a"}));
}

TEST(BlockRestorerTest, ReplacementTextIsLiteral) {
  PreservedBlocks blocks;
  blocks[BlockKind::Script] = {"s = '$1 $& \\\\';"};
  EXPECT_EQ("<script>s = '$1 $& \\\\';</script>",
            BlockRestorer::restore(
                "<script>%%%~COMPRESS~SCRIPT~0~%%%</script>", blocks));
}

// Later passes run first on restore, so a skip block that holds a user
// placeholder gets its user content back.
TEST(BlockRestorerTest, ReverseOrder) {
  PreservedBlocks blocks;
  blocks.user = {{"<?php a ?>"}};
  blocks[BlockKind::CondComment] = {
      "<!--[if IE]>%%%~COMPRESS~SKIP~0~%%%<![endif]-->"};
  blocks[BlockKind::Skip] = {"%%%~COMPRESS~USER0~0~%%% raw"};

  EXPECT_EQ("<!--[if IE]><?php a ?> raw<![endif]-->",
            BlockRestorer::restore("%%%~COMPRESS~COND~0~%%%", blocks));
}

TEST(BlockRestorerTest, UserRulesRestoreLastToFirst) {
  PreservedBlocks blocks;
  blocks.user = {{"<? x ?>"}, {"[%%%~COMPRESS~USER0~0~%%%]"}};
  EXPECT_EQ("[<? x ?>]",
            BlockRestorer::restore("%%%~COMPRESS~USER1~0~%%%", blocks));
}

TEST(BlockRestorerTest, RestoresOnlyOwnDepth) {
  PreservedBlocks blocks;
  blocks.depth = 1;
  blocks[BlockKind::Skip] = {"inner"};
  EXPECT_EQ("%%%~COMPRESS~SKIP~0~%%%inner",
            BlockRestorer::restore(
                "%%%~COMPRESS~SKIP~0~%%%%%%~COMPRESS1~SKIP~0~%%%", blocks));
}

TEST(BlockRestorerTest, InvertsExtraction) {
  HtmlCompressorOptions opts;
  opts.preserve_line_breaks = true;
  opts.preserve_patterns = {PreservePattern::php_tags()};

  std::string html =
      "<div onclick=\"a()\">\n<?php echo 1; ?>\n<pre> p </pre>"
      "<!-- {{{ --> s <!-- }}} --><script>x  = 1;</script>"
      "<style> b {} </style><textarea> t </textarea></div>";

  PreservedBlocks blocks;
  std::string skeleton = BlockExtractor(opts).extract(html, blocks);
  EXPECT_EQ(std::string::npos, skeleton.find("<pre> p"));
  // skip markers are not part of the preserved block
  EXPECT_EQ("<div onclick=\"a()\">\n<?php echo 1; ?>\n<pre> p </pre>"
            " s <script>x  = 1;</script>"
            "<style> b {} </style><textarea> t </textarea></div>",
            BlockRestorer::restore(skeleton, blocks));
}

} // namespace
