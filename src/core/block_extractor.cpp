#include "block_extractor.hpp"
#include "utils/text.hpp"
#include <regex>
#include <utility>

namespace {

// Opening and closing markers are matched separately; bodies are found by
// scanning for the closing marker.

const std::regex &skip_open_pattern() {
  static const std::regex pattern{R"(<!--\s*\{\{\{\s*-->)"};
  return pattern;
}

const std::regex &skip_close_pattern() {
  static const std::regex pattern{R"(<!--\s*\}\}\}\s*-->)"};
  return pattern;
}

const std::regex &cond_comment_open_pattern() {
  static const std::regex pattern{R"(<!(?:--)?\[[^\]]+?\]>)",
                                  std::regex::icase};
  return pattern;
}

const std::regex &cond_comment_close_pattern() {
  static const std::regex pattern{R"(<!\[[^\]]+\]-->)", std::regex::icase};
  return pattern;
}

const std::regex &double_quoted_event_pattern() {
  static const std::regex pattern{
      R"re((\son[a-z]+\s*=\s*")([^"\\\r\n]*(?:\\.[^"\\\r\n]*)*)("))re",
      std::regex::icase};
  return pattern;
}

const std::regex &single_quoted_event_pattern() {
  static const std::regex pattern{
      R"re((\son[a-z]+\s*=\s*')([^'\\\r\n]*(?:\\.[^'\\\r\n]*)*)('))re",
      std::regex::icase};
  return pattern;
}

const std::regex &pre_open_pattern() {
  static const std::regex pattern{R"(<pre[^>]*?>)", std::regex::icase};
  return pattern;
}

const std::regex &script_open_pattern() {
  static const std::regex pattern{R"(<script[^>]*?>)", std::regex::icase};
  return pattern;
}

const std::regex &style_open_pattern() {
  static const std::regex pattern{R"(<style[^>]*?>)", std::regex::icase};
  return pattern;
}

const std::regex &textarea_open_pattern() {
  static const std::regex pattern{R"(<textarea[^>]*?>)", std::regex::icase};
  return pattern;
}

const std::regex &type_attr_pattern() {
  static const std::regex pattern{
      R"re(\stype\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'>]+)))re",
      std::regex::icase};
  return pattern;
}

const std::regex &line_break_pattern() {
  static const std::regex pattern{R"((?:[ \t]*(\r?\n)[ \t]*)+)"};
  return pattern;
}

enum class ScriptRoute { JavaScript, Template, Opaque };

ScriptRoute classify_script(const std::string &open_tag) {
  std::smatch type_match;
  std::string type;
  if (std::regex_search(open_tag, type_match, type_attr_pattern())) {
    for (size_t group = 1; group < type_match.size(); group++) {
      if (type_match[group].matched) {
        type = to_lower(trim(type_match.str(group)));
        break;
      }
    }
  }

  if (type.empty() || type == "text/javascript" ||
      type == "application/javascript") {
    return ScriptRoute::JavaScript;
  }
  if (type == "text/x-jquery-tmpl") {
    return ScriptRoute::Template;
  }
  return ScriptRoute::Opaque;
}

// Stores `block` at the end of `list` and returns its index.
size_t store(std::vector<std::string> &list, std::string block) {
  list.push_back(std::move(block));
  return list.size() - 1;
}

} // namespace

BlockExtractor::BlockExtractor(HtmlCompressorOptions opts,
                               NestedCompressor nested)
    : opts(std::move(opts)), nested_compressor(std::move(nested)) {}

const std::vector<BlockKind> &BlockExtractor::pass_order() {
  static const std::vector<BlockKind> order = {
      BlockKind::User, BlockKind::Skip, BlockKind::CondComment,
      BlockKind::Event, BlockKind::Pre, BlockKind::Script,
      BlockKind::Style, BlockKind::TextArea, BlockKind::LineBreak};
  return order;
}

std::string BlockExtractor::extract(const std::string &html,
                                    PreservedBlocks &blocks) const {
  std::string skeleton = html;
  for (BlockKind kind : pass_order()) {
    skeleton = run_pass(kind, skeleton, blocks);
  }
  return skeleton;
}

std::string BlockExtractor::run_pass(BlockKind kind, const std::string &html,
                                     PreservedBlocks &blocks) const {
  switch (kind) {
  case BlockKind::User:
    return extract_user_blocks(html, blocks);
  case BlockKind::Skip:
    return extract_skip_blocks(html, blocks);
  case BlockKind::CondComment:
    return extract_cond_comments(html, blocks);
  case BlockKind::Event:
    return extract_events(html, blocks);
  case BlockKind::Pre:
    return extract_tag_bodies(html, pre_open_pattern(), "</pre>",
                              BlockKind::Pre, blocks);
  case BlockKind::Script:
    return extract_scripts(html, blocks);
  case BlockKind::Style:
    return extract_tag_bodies(html, style_open_pattern(), "</style>",
                              BlockKind::Style, blocks);
  case BlockKind::TextArea:
    return extract_tag_bodies(html, textarea_open_pattern(), "</textarea>",
                              BlockKind::TextArea, blocks);
  case BlockKind::LineBreak:
    return opts.preserve_line_breaks ? extract_line_breaks(html, blocks) : html;
  case BlockKind::CData:
    break;
  }
  return html;
}

std::string BlockExtractor::extract_user_blocks(const std::string &html,
                                                PreservedBlocks &blocks) const {
  std::string result = html;

  for (size_t rule = 0; rule < opts.preserve_patterns.size(); rule++) {
    if (blocks.user.size() <= rule) {
      blocks.user.resize(rule + 1);
    }
    auto &list = blocks.user[rule];
    auto preserve = [&](const std::string &block) {
      if (is_blank(block)) {
        return block;
      }
      return make_user_placeholder(rule, store(list, block), blocks.depth);
    };

    const PreservePattern &pattern = opts.preserve_patterns[rule];
    if (pattern.close()) {
      result = replace_delimited(
          result, pattern.regex(), *pattern.close(),
          [&](const std::smatch &open, const std::string &body,
              const std::string &close) {
            return preserve(open.str(0) + body + close);
          });
    } else {
      result = replace_matches(
          result, pattern.regex(),
          [&](const std::smatch &match) { return preserve(match.str(0)); });
    }
  }

  return result;
}

std::string BlockExtractor::extract_skip_blocks(const std::string &html,
                                                PreservedBlocks &blocks) const {
  auto &list = blocks[BlockKind::Skip];
  return replace_delimited(
      html, skip_open_pattern(), skip_close_pattern(),
      [&](const std::smatch &open, const std::string &body,
          const std::string &close) {
        if (is_blank(body)) {
          return open.str(0) + body + close;
        }
        return make_placeholder(BlockKind::Skip, store(list, body),
                                blocks.depth);
      });
}

std::string
BlockExtractor::extract_cond_comments(const std::string &html,
                                      PreservedBlocks &blocks) const {
  auto &list = blocks[BlockKind::CondComment];
  return replace_delimited(
      html, cond_comment_open_pattern(), cond_comment_close_pattern(),
      [&](const std::smatch &open, const std::string &body,
          const std::string &close) {
        if (is_blank(body)) {
          return open.str(0) + body + close;
        }
        std::string compressed =
            nested_compressor ? nested_compressor(body) : body;
        return make_placeholder(BlockKind::CondComment,
                                store(list, open.str(0) + compressed + close),
                                blocks.depth);
      });
}

std::string BlockExtractor::extract_events(const std::string &html,
                                           PreservedBlocks &blocks) const {
  auto &list = blocks[BlockKind::Event];
  auto preserve_value = [&](const std::smatch &match) {
    if (is_blank(match.str(2))) {
      return match.str(0);
    }
    return match.str(1) +
           make_placeholder(BlockKind::Event, store(list, match.str(2)),
                            blocks.depth) +
           match.str(3);
  };

  std::string result =
      replace_matches(html, double_quoted_event_pattern(), preserve_value);
  return replace_matches(result, single_quoted_event_pattern(),
                         preserve_value);
}

std::string BlockExtractor::extract_scripts(const std::string &html,
                                            PreservedBlocks &blocks) const {
  auto &scripts = blocks[BlockKind::Script];
  auto &skipped = blocks[BlockKind::Skip];

  return replace_delimited(
      html, script_open_pattern(), std::string("</script>"),
      [&](const std::smatch &open, const std::string &body,
          const std::string &close) {
        if (is_blank(body)) {
          return open.str(0) + body + close;
        }

        switch (classify_script(open.str(0))) {
        case ScriptRoute::JavaScript:
          return open.str(0) +
                 make_placeholder(BlockKind::Script, store(scripts, body),
                                  blocks.depth) +
                 close;
        case ScriptRoute::Template:
          // compressed together with the surrounding markup
          return open.str(0) + body + close;
        case ScriptRoute::Opaque:
          break;
        }
        return open.str(0) +
               make_placeholder(BlockKind::Skip, store(skipped, body),
                                blocks.depth) +
               close;
      });
}

std::string BlockExtractor::extract_line_breaks(const std::string &html,
                                                PreservedBlocks &blocks) const {
  auto &list = blocks[BlockKind::LineBreak];
  return replace_matches(
      html, line_break_pattern(), [&](const std::smatch &match) {
        return make_placeholder(BlockKind::LineBreak,
                                store(list, match.str(1)), blocks.depth);
      });
}

std::string BlockExtractor::extract_tag_bodies(const std::string &html,
                                               const std::regex &open,
                                               const std::string &close,
                                               BlockKind kind,
                                               PreservedBlocks &blocks) const {
  auto &list = blocks[kind];
  return replace_delimited(
      html, open, close,
      [&](const std::smatch &open_tag, const std::string &body,
          const std::string &close_tag) {
        if (is_blank(body)) {
          return open_tag.str(0) + body + close_tag;
        }
        return open_tag.str(0) +
               make_placeholder(kind, store(list, body), blocks.depth) +
               close_tag;
      });
}
