#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "core/compressor.hpp"
#include "core/compressor_options.hpp"
#include "core/preserve_pattern.hpp"
#include <filesystem>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// Settings of one crimp run, read from a YAML file:
//
//   type: html
//   js_compressor: quickjs
//   minifier_bundle: assets/minifiers_bundle.js
//   preserve_php: true
//   html:
//     remove_intertag_spaces: true
//     remove_surrounding_spaces: max
//   xml:
//     remove_comments: false
class CrimpConfig {
private:
  static void read_flag(const YAML::Node &node, const char *key, bool &flag) {
    if (node[key]) {
      flag = node[key].as<bool>();
    }
  }

  static void read_html_options(const YAML::Node &node,
                                HtmlCompressorOptions &html) {
    read_flag(node, "enabled", html.enabled);
    read_flag(node, "remove_comments", html.remove_comments);
    read_flag(node, "remove_multi_spaces", html.remove_multi_spaces);
    read_flag(node, "remove_spaces_inside_tags",
              html.remove_spaces_inside_tags);
    read_flag(node, "remove_intertag_spaces", html.remove_intertag_spaces);
    read_flag(node, "remove_quotes", html.remove_quotes);
    read_flag(node, "preserve_line_breaks", html.preserve_line_breaks);
    read_flag(node, "simple_doctype", html.simple_doctype);
    read_flag(node, "remove_script_attributes", html.remove_script_attributes);
    read_flag(node, "remove_style_attributes", html.remove_style_attributes);
    read_flag(node, "remove_link_attributes", html.remove_link_attributes);
    read_flag(node, "remove_form_attributes", html.remove_form_attributes);
    read_flag(node, "remove_input_attributes", html.remove_input_attributes);
    read_flag(node, "simple_boolean_attributes",
              html.simple_boolean_attributes);
    read_flag(node, "remove_javascript_protocol",
              html.remove_javascript_protocol);
    read_flag(node, "remove_http_protocol", html.remove_http_protocol);
    read_flag(node, "remove_https_protocol", html.remove_https_protocol);
    read_flag(node, "compress_js", html.compress_javascript);
    read_flag(node, "compress_css", html.compress_css);

    if (node["remove_surrounding_spaces"]) {
      html.remove_surrounding_spaces =
          node["remove_surrounding_spaces"].as<std::string>();
    }
  }

  static void read(const YAML::Node &yaml, const fs::path &base_dir,
                   CrimpConfig &config) {
    if (yaml["type"])
      config.type = yaml["type"].as<std::string>();
    if (yaml["js_compressor"])
      config.js_compressor = yaml["js_compressor"].as<std::string>();
    if (yaml["minifier_bundle"])
      config.minifier_bundle =
          (base_dir / yaml["minifier_bundle"].as<std::string>()).string();
    if (yaml["preserve_patterns_file"])
      config.preserve_patterns_file =
          (base_dir / yaml["preserve_patterns_file"].as<std::string>())
              .string();
    if (yaml["preserve_patterns"])
      config.preserve_patterns =
          yaml["preserve_patterns"].as<std::vector<std::string>>();

    read_flag(yaml, "preserve_php", config.preserve_php);
    read_flag(yaml, "preserve_server_script", config.preserve_server_script);
    read_flag(yaml, "preserve_ssi", config.preserve_ssi);
    read_flag(yaml, "statistics", config.statistics);

    if (yaml["html"]) {
      read_html_options(yaml["html"], config.html);
    }

    if (yaml["xml"]) {
      read_flag(yaml["xml"], "enabled", config.xml.enabled);
      read_flag(yaml["xml"], "remove_comments", config.xml.remove_comments);
      read_flag(yaml["xml"], "remove_intertag_spaces",
                config.xml.remove_intertag_spaces);
    }
  }

public:
  std::string type;
  std::string js_compressor = "basic";
  std::string minifier_bundle;

  bool preserve_php = false;
  bool preserve_server_script = false;
  bool preserve_ssi = false;
  std::vector<std::string> preserve_patterns;
  std::string preserve_patterns_file;

  bool statistics = false;

  HtmlCompressorOptions html;
  XmlCompressorOptions xml;

  static CrimpConfig load(const fs::path &config_path) {
    if (!fs::exists(config_path)) {
      throw ConfigError("Config file not found: " + config_path.string());
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw ConfigError("YAML parsing error in " + config_path.string() +
                        ": " + std::string(e.what()));
    }

    return from_yaml(yaml, config_path.parent_path());
  }

  // Relative file names are resolved against `base_dir`.
  static CrimpConfig from_yaml(const YAML::Node &yaml,
                               const fs::path &base_dir = fs::path()) {
    CrimpConfig config;

    try {
      read(yaml, base_dir, config);
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid configuration: " + std::string(e.what()));
    }

    config.validate();
    config.html.generate_statistics = config.statistics;
    config.html.preserve_patterns = config.build_preserve_patterns();

    return config;
  }

  void validate() const {
    static const std::unordered_set<std::string> types = {"", "html", "xml"};
    if (types.find(type) == types.end()) {
      throw ConfigError("Unknown type: " + type);
    }

    static const std::unordered_set<std::string> js_compressors = {
        "basic", "quickjs", "none"};
    if (js_compressors.find(js_compressor) == js_compressors.end()) {
      throw ConfigError("Unknown js_compressor: " + js_compressor);
    }

    if (js_compressor == "quickjs" && minifier_bundle.empty()) {
      throw ConfigError("js_compressor 'quickjs' requires minifier_bundle");
    }
  }

  // Predefined patterns first, then inline patterns, then the patterns file.
  std::vector<PreservePattern> build_preserve_patterns() const {
    std::vector<PreservePattern> patterns;

    if (preserve_php)
      patterns.push_back(PreservePattern::php_tags());
    if (preserve_server_script)
      patterns.push_back(PreservePattern::server_script_tags());
    if (preserve_ssi)
      patterns.push_back(PreservePattern::server_side_includes());

    for (const auto &expression : preserve_patterns) {
      patterns.push_back(PreservePattern::compile(expression));
    }

    if (!preserve_patterns_file.empty()) {
      for (auto &pattern : PreservePattern::load_file(preserve_patterns_file)) {
        patterns.push_back(std::move(pattern));
      }
    }

    return patterns;
  }
};

#endif
