#include "html_compressor.hpp"
#include "basic_minifiers.hpp"
#include "block_extractor.hpp"
#include "block_restorer.hpp"
#include "sub_compressor.hpp"
#include "utils/log.hpp"
#include "utils/text.hpp"
#include <chrono>
#include <utility>

namespace {

size_t total_length(const std::vector<std::string> &blocks) {
  size_t length = 0;
  for (const auto &block : blocks) {
    length += block.length();
  }
  return length;
}

std::string remove_javascript_protocol(const std::string &handler) {
  static const std::string protocol = "javascript:";
  if (!equals_ignore_case(handler.substr(0, protocol.length()), protocol)) {
    return handler;
  }
  size_t code = protocol.length();
  while (code < handler.length() && is_space(handler[code])) {
    code++;
  }
  if (code == handler.length()) {
    return handler;
  }
  return handler.substr(code);
}

} // namespace

HtmlCompressor::HtmlCompressor(Options opts)
    : opts(std::move(opts)), transformer(this->opts) {
  if (this->opts.compress_javascript) {
    js_compressor = std::make_shared<JsMinifier>();
  }
  if (this->opts.compress_css) {
    style_compressor = std::make_shared<CssMinifier>();
  }
}

void HtmlCompressor::set_javascript_compressor(
    std::shared_ptr<Compressor> compressor) {
  js_compressor = std::move(compressor);
}

void HtmlCompressor::set_css_compressor(
    std::shared_ptr<Compressor> compressor) {
  style_compressor = std::move(compressor);
}

std::string HtmlCompressor::compress(const std::string &html) {
  if (!opts.enabled || html.empty()) {
    return html;
  }

  if (contains_placeholder_sigil(html)) {
    log_warning(std::string("Input contains the reserved sequence '") +
                PLACEHOLDER_SIGIL + "', leaving it uncompressed");
    return html;
  }

  return run(html);
}

std::string HtmlCompressor::run(const std::string &html) {
  auto start = std::chrono::steady_clock::now();
  init_statistics(html);

  PreservedBlocks blocks;
  blocks.depth = depth;
  BlockExtractor extractor(opts, [this](const std::string &body) {
    return compress_nested(body);
  });

  std::string result = extractor.extract(html, blocks);
  result = transformer.transform(result);
  process_preserved_blocks(blocks);
  result = BlockRestorer::restore(result, blocks);

  end_statistics(result, start);

  return result;
}

std::string HtmlCompressor::compress_nested(const std::string &html) const {
  Options nested_opts = opts;
  nested_opts.generate_statistics = false;

  HtmlCompressor nested(std::move(nested_opts));
  nested.set_javascript_compressor(js_compressor);
  nested.set_css_compressor(style_compressor);
  nested.depth = depth + 1;

  // the body may hold placeholders of the enclosing document
  return nested.run(html);
}

void HtmlCompressor::process_preserved_blocks(PreservedBlocks &blocks) {
  add_preserved(blocks.get(BlockKind::Pre));
  add_preserved(blocks.get(BlockKind::TextArea));
  process_script_blocks(blocks[BlockKind::Script]);
  process_style_blocks(blocks[BlockKind::Style]);
  process_event_blocks(blocks[BlockKind::Event]);
  add_preserved(blocks.get(BlockKind::CondComment));
  add_preserved(blocks.get(BlockKind::Skip));
  for (const auto &user_blocks : blocks.user) {
    add_preserved(user_blocks);
  }
  add_preserved(blocks.get(BlockKind::LineBreak));
}

void HtmlCompressor::process_script_blocks(std::vector<std::string> &blocks) {
  if (stats) {
    stats->original.inline_script_size += total_length(blocks);
  }

  if (opts.compress_javascript) {
    SubCompressor("JavaScript", js_compressor).compress_all(blocks);
  } else {
    add_preserved(blocks);
  }

  if (stats) {
    stats->compressed.inline_script_size += total_length(blocks);
  }
}

void HtmlCompressor::process_style_blocks(std::vector<std::string> &blocks) {
  if (stats) {
    stats->original.inline_style_size += total_length(blocks);
  }

  if (opts.compress_css) {
    SubCompressor("CSS", style_compressor).compress_all(blocks);
  } else {
    add_preserved(blocks);
  }

  if (stats) {
    stats->compressed.inline_style_size += total_length(blocks);
  }
}

void HtmlCompressor::process_event_blocks(std::vector<std::string> &blocks) {
  if (stats) {
    stats->original.inline_event_size += total_length(blocks);
  }

  if (opts.remove_javascript_protocol) {
    for (auto &block : blocks) {
      block = remove_javascript_protocol(block);
    }
  }
  add_preserved(blocks);

  if (stats) {
    stats->compressed.inline_event_size += total_length(blocks);
  }
}

void HtmlCompressor::add_preserved(const std::vector<std::string> &blocks) {
  if (stats) {
    stats->preserved_size += total_length(blocks);
  }
}

void HtmlCompressor::init_statistics(const std::string &html) {
  if (!opts.generate_statistics) {
    stats.reset();
    return;
  }

  stats = HtmlCompressorStatistics{};
  stats->original.filesize = html.length();
  stats->original.empty_chars = count_whitespace(html);
}

void HtmlCompressor::end_statistics(
    const std::string &html, std::chrono::steady_clock::time_point start) {
  if (!stats) {
    return;
  }

  stats->time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
  stats->compressed.filesize = html.length();
  stats->compressed.empty_chars = count_whitespace(html);
}
