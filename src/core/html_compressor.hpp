#ifndef HTML_COMPRESSOR_HPP
#define HTML_COMPRESSOR_HPP

#include "compressor.hpp"
#include "compressor_options.hpp"
#include "preserved_blocks.hpp"
#include "skeleton_transformer.hpp"
#include "statistics.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Compresses HTML by removing comments, extra spaces and redundant syntax
// while keeping <pre>, <textarea>, <script>, <style>, event handlers,
// conditional comments, <!-- {{{ --> ... <!-- }}} --> blocks and any user
// preserve pattern intact.
//
// compress(html) = restore(transform(extract(html)), blocks)
class HtmlCompressor : public Compressor {
public:
  using Options = HtmlCompressorOptions;

  // Throws ConfigError for an unusable remove_surrounding_spaces value.
  explicit HtmlCompressor(Options opts = Options());

  std::string compress(const std::string &html) override;

  // When compress_javascript / compress_css is set the built-in minifiers
  // are used until replaced here. Passing nullptr marks the compressor as
  // unavailable: blocks are then kept unminified.
  void set_javascript_compressor(std::shared_ptr<Compressor> compressor);
  void set_css_compressor(std::shared_ptr<Compressor> compressor);

  const std::shared_ptr<Compressor> &javascript_compressor() const {
    return js_compressor;
  }
  const std::shared_ptr<Compressor> &css_compressor() const {
    return style_compressor;
  }

  const Options &options() const { return opts; }

  // Statistics of the last call, empty unless generate_statistics is set.
  const std::optional<HtmlCompressorStatistics> &statistics() const {
    return stats;
  }

private:
  Options opts;
  SkeletonTransformer transformer;
  std::shared_ptr<Compressor> js_compressor;
  std::shared_ptr<Compressor> style_compressor;
  std::optional<HtmlCompressorStatistics> stats;
  size_t depth = 0;

  std::string run(const std::string &html);
  std::string compress_nested(const std::string &html) const;

  void process_preserved_blocks(PreservedBlocks &blocks);
  void process_script_blocks(std::vector<std::string> &blocks);
  void process_style_blocks(std::vector<std::string> &blocks);
  void process_event_blocks(std::vector<std::string> &blocks);
  void add_preserved(const std::vector<std::string> &blocks);

  void init_statistics(const std::string &html);
  void end_statistics(const std::string &html,
                      std::chrono::steady_clock::time_point start);
};

#endif // HTML_COMPRESSOR_HPP
