#include "core/block_extractor.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class BlockExtractorTest : public testing::Test {
protected:
  std::string Extract(const std::string &html) {
    BlockExtractor extractor(opts, nested);
    return extractor.extract(html, blocks);
  }

  HtmlCompressorOptions opts;
  BlockExtractor::NestedCompressor nested;
  PreservedBlocks blocks;
};

TEST_F(BlockExtractorTest, PassOrder) {
  std::vector<BlockKind> expected = {
      BlockKind::User, BlockKind::Skip, BlockKind::CondComment,
      BlockKind::Event, BlockKind::Pre, BlockKind::Script,
      BlockKind::Style, BlockKind::TextArea, BlockKind::LineBreak};
  EXPECT_EQ(expected, BlockExtractor::pass_order());
}

TEST_F(BlockExtractorTest, PreBody) {
  EXPECT_EQ("<pre class=\"x\">%%%~COMPRESS~PRE~0~%%%</pre>",
            Extract("<pre class=\"x\">  a \n b  </pre>"));
  ASSERT_EQ(1u, blocks.count(BlockKind::Pre));
  EXPECT_EQ("  a \n b  ", blocks.get(BlockKind::Pre)[0]);
}

TEST_F(BlockExtractorTest, StyleAndTextAreaBodies) {
  EXPECT_EQ("<style media=\"all\">%%%~COMPRESS~STYLE~0~%%%</style>"
            "<TEXTAREA>%%%~COMPRESS~TEXTAREA~0~%%%</TEXTAREA>",
            Extract("<style media=\"all\"> p { color: red; } </style>"
                    "<TEXTAREA>a  b</TEXTAREA>"));
  EXPECT_EQ(" p { color: red; } ", blocks.get(BlockKind::Style)[0]);
  EXPECT_EQ("a  b", blocks.get(BlockKind::TextArea)[0]);
}

TEST_F(BlockExtractorTest, BlankBodiesStayInPlace) {
  std::string html = "<pre>   </pre><textarea></textarea><script> </script>";
  EXPECT_EQ(html, Extract(html));
  EXPECT_EQ(0u, blocks.count(BlockKind::Pre));
  EXPECT_EQ(0u, blocks.count(BlockKind::TextArea));
  EXPECT_EQ(0u, blocks.count(BlockKind::Script));
}

TEST_F(BlockExtractorTest, ScriptRouting) {
  std::string html =
      "<script>var a;</script>"
      "<script type=\"text/x-custom\">raw  text</script>"
      "<script type=\"text/x-jquery-tmpl\"><b> x </b></script>";

  EXPECT_EQ("<script>%%%~COMPRESS~SCRIPT~0~%%%</script>"
            "<script type=\"text/x-custom\">%%%~COMPRESS~SKIP~0~%%%</script>"
            "<script type=\"text/x-jquery-tmpl\"><b> x </b></script>",
            Extract(html));

  ASSERT_EQ(1u, blocks.count(BlockKind::Script));
  EXPECT_EQ("var a;", blocks.get(BlockKind::Script)[0]);
  ASSERT_EQ(1u, blocks.count(BlockKind::Skip));
  EXPECT_EQ("raw  text", blocks.get(BlockKind::Skip)[0]);
}

TEST_F(BlockExtractorTest, JavaScriptTypeSpellings) {
  Extract("<script type=text/javascript>a()</script>"
          "<script src=\"x.js\" type='application/javascript'>b()</script>"
          "<script TYPE=\"Text/JavaScript\">c()</script>");
  EXPECT_EQ(3u, blocks.count(BlockKind::Script));
  EXPECT_EQ(0u, blocks.count(BlockKind::Skip));
}

TEST_F(BlockExtractorTest, OpaqueScriptsContinueSkipIndexes) {
  EXPECT_EQ("%%%~COMPRESS~SKIP~0~%%%"
            "<script type=\"text/template\">%%%~COMPRESS~SKIP~1~%%%</script>",
            Extract("<!-- {{{ -->keep  me<!-- }}} -->"
                    "<script type=\"text/template\">tpl</script>"));
  std::vector<std::string> expected = {"keep  me", "tpl"};
  EXPECT_EQ(expected, blocks.get(BlockKind::Skip));
}

TEST_F(BlockExtractorTest, SkipBlockHidesLaterPasses) {
  EXPECT_EQ("%%%~COMPRESS~SKIP~0~%%%",
            Extract("<!-- {{{ --><script>a()</script><!-- }}} -->"));
  EXPECT_EQ(0u, blocks.count(BlockKind::Script));
  EXPECT_EQ("<script>a()</script>", blocks.get(BlockKind::Skip)[0]);
}

TEST_F(BlockExtractorTest, EventHandlers) {
  EXPECT_EQ("<a onclick=\"%%%~COMPRESS~EVENT~0~%%%\" "
            "onmouseover='%%%~COMPRESS~EVENT~1~%%%'>",
            Extract("<a onclick=\"go('x')\" onmouseover='stop()'>"));
  std::vector<std::string> expected = {"go('x')", "stop()"};
  EXPECT_EQ(expected, blocks.get(BlockKind::Event));
}

TEST_F(BlockExtractorTest, EventHandlerWithEscapedQuotes) {
  Extract("<a onclick=\"say(\\\"hi\\\")\">");
  ASSERT_EQ(1u, blocks.count(BlockKind::Event));
  EXPECT_EQ("say(\\\"hi\\\")", blocks.get(BlockKind::Event)[0]);
}

TEST_F(BlockExtractorTest, ConditionalCommentBodyIsCompressed) {
  nested = [](const std::string &body) { return "[" + body + "]"; };
  EXPECT_EQ("<p>a</p>%%%~COMPRESS~COND~0~%%%",
            Extract("<p>a</p><!--[if IE]> <p>x</p> <![endif]-->"));
  ASSERT_EQ(1u, blocks.count(BlockKind::CondComment));
  EXPECT_EQ("<!--[if IE]>[ <p>x</p> ]<![endif]-->",
            blocks.get(BlockKind::CondComment)[0]);
}

TEST_F(BlockExtractorTest, ConditionalCommentWithoutNestedCompressor) {
  Extract("<!--[if lt IE 9]><script src=\"h.js\"></script><![endif]-->");
  ASSERT_EQ(1u, blocks.count(BlockKind::CondComment));
  EXPECT_EQ("<!--[if lt IE 9]><script src=\"h.js\"></script><![endif]-->",
            blocks.get(BlockKind::CondComment)[0]);
}

TEST_F(BlockExtractorTest, UserPatterns) {
  opts.preserve_patterns = {PreservePattern::php_tags(),
                            PreservePattern::server_script_tags()};
  EXPECT_EQ("<p>%%%~COMPRESS~USER0~0~%%%%%%~COMPRESS~USER1~0~%%%"
            "%%%~COMPRESS~USER0~1~%%%</p>",
            Extract("<p><?php a ?><% b %><?php c ?></p>"));
  ASSERT_EQ(2u, blocks.user.size());
  std::vector<std::string> php = {"<?php a ?>", "<?php c ?>"};
  EXPECT_EQ(php, blocks.user[0]);
  std::vector<std::string> asp = {"<% b %>"};
  EXPECT_EQ(asp, blocks.user[1]);
}

TEST_F(BlockExtractorTest, LargeUserBlockAndUnclosedTags) {
  opts.preserve_patterns = {PreservePattern::server_script_tags()};
  std::string body(1024 * 1024, 'x');
  EXPECT_EQ("<p>%%%~COMPRESS~USER0~0~%%%</p><pre> open",
            Extract("<p><% " + body + " %></p><pre> open"));
  ASSERT_EQ(1u, blocks.user.size());
  ASSERT_EQ(1u, blocks.user[0].size());
  EXPECT_EQ("<% " + body + " %>", blocks.user[0][0]);
  EXPECT_EQ(0u, blocks.count(BlockKind::Pre));
}

TEST_F(BlockExtractorTest, TagBodiesEndAtFirstCloseTagInAnyCase) {
  EXPECT_EQ("<PRE>%%%~COMPRESS~PRE~0~%%%</Pre> b </pre>",
            Extract("<PRE> a </Pre> b </pre>"));
  EXPECT_EQ(" a ", blocks.get(BlockKind::Pre)[0]);
}

TEST_F(BlockExtractorTest, LineBreaks) {
  opts.preserve_line_breaks = true;
  EXPECT_EQ("<p>a</p>%%%~COMPRESS~LT~0~%%%<p>b</p>%%%~COMPRESS~LT~1~%%%c",
            Extract("<p>a</p>\n  <p>b</p> \r\n\t c"));
  std::vector<std::string> expected = {"\n", "\r\n"};
  EXPECT_EQ(expected, blocks.get(BlockKind::LineBreak));
}

TEST_F(BlockExtractorTest, LineBreaksKeptInSkeletonByDefault) {
  BlockExtractor extractor(opts);
  EXPECT_EQ("a\n b",
            extractor.run_pass(BlockKind::LineBreak, "a\n b", blocks));
  EXPECT_EQ(0u, blocks.count(BlockKind::LineBreak));
}

TEST_F(BlockExtractorTest, NestedDepthPlaceholders) {
  blocks.depth = 1;
  EXPECT_EQ("<pre>%%%~COMPRESS1~PRE~0~%%%</pre>", Extract("<pre>x</pre>"));
}

} // namespace
