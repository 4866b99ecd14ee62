#pragma once
#include "compressor.hpp"
#include "quickjs.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Runs Terser and csso inside an embedded QuickJS interpreter. The bundle
// exposing the global `Terser` and `csso` objects is read from disk.
class QuickJsMinifier {
private:
  JSRuntime *rt;
  JSContext *ctx;
  bool initialized;

  std::optional<std::string> callMinifier(const char *function,
                                          const std::string &code);
  std::string takeException();
  bool runPendingJobs();

public:
  QuickJsMinifier();
  ~QuickJsMinifier();

  QuickJsMinifier(const QuickJsMinifier &) = delete;
  QuickJsMinifier &operator=(const QuickJsMinifier &) = delete;

  bool initialize(const fs::path &bundle_path);
  bool isInitialized() const { return initialized; }

  std::optional<std::string> minifyJS(const std::string &jsCode);
  std::optional<std::string> minifyCSS(const std::string &cssCode);
};

// Compressor facade over one language of a shared QuickJsMinifier. Falls back
// to the source text whenever the interpreter reports an error.
class QuickJsCompressor : public Compressor {
public:
  enum class Language { JavaScript, Css };

  QuickJsCompressor(std::shared_ptr<QuickJsMinifier> minifier,
                    Language language);

  std::string compress(const std::string &source) override;

private:
  std::shared_ptr<QuickJsMinifier> minifier;
  Language language;
};
