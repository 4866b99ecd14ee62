#include "core/html_compressor.hpp"
#include "core/quickjs_minifier.hpp"
#include "core/xml_compressor.hpp"
#include "utils/config.hpp"
#include "utils/log.hpp"
#include "utils/text.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "crimp - HTML and XML compressor\n\n";
  std::cout << "Usage:\n";
  std::cout << "  crimp [options] [input]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>       YAML settings file\n";
  std::cout << "  -o, --output <file>       Write result to file (default: "
               "stdout)\n";
  std::cout << "  -t, --type <html|xml>     Input type (default: detected "
               "from extension)\n";
  std::cout << "  -s, --stats               Print HTML compression "
               "statistics as JSON to stderr\n";
  std::cout << "  -h, --help                Show this help\n\n";
  std::cout << "Reads stdin when no input file is given.\n";
}

std::string read_input(const std::string &path) {
  if (path.empty()) {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void write_output(const std::string &path, const std::string &content) {
  if (path.empty()) {
    std::cout << content;
    return;
  }

  fs::path output(path);
  if (output.has_parent_path()) {
    fs::create_directories(output.parent_path());
  }
  std::ofstream file(output, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write file: " + path);
  }
  file << content;
}

std::unique_ptr<HtmlCompressor>
create_html_compressor(const CrimpConfig &config) {
  auto compressor = std::make_unique<HtmlCompressor>(config.html);

  if (config.js_compressor == "none") {
    compressor->set_javascript_compressor(nullptr);
    compressor->set_css_compressor(nullptr);
  } else if (config.js_compressor == "quickjs" &&
             (config.html.compress_javascript || config.html.compress_css)) {
    auto minifier = std::make_shared<QuickJsMinifier>();
    if (!minifier->initialize(config.minifier_bundle)) {
      log_warning("QuickJS minifiers unavailable, script and style blocks "
                  "are left unminified");
      compressor->set_javascript_compressor(nullptr);
      compressor->set_css_compressor(nullptr);
    } else {
      compressor->set_javascript_compressor(std::make_shared<QuickJsCompressor>(
          minifier, QuickJsCompressor::Language::JavaScript));
      compressor->set_css_compressor(std::make_shared<QuickJsCompressor>(
          minifier, QuickJsCompressor::Language::Css));
    }
  }

  return compressor;
}

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string output_path;
  std::string type;
  std::string input_path;
  bool print_stats = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--stats" || arg == "-s") {
      print_stats = true;
    } else if ((arg == "--config" || arg == "-c" || arg == "--output" ||
                arg == "-o" || arg == "--type" || arg == "-t")) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        print_usage();
        return 1;
      }
      std::string value = argv[++i];
      if (arg == "--config" || arg == "-c") {
        config_path = value;
      } else if (arg == "--output" || arg == "-o") {
        output_path = value;
      } else {
        type = to_lower(value);
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_usage();
      return 1;
    } else if (input_path.empty()) {
      input_path = arg;
    } else {
      std::cerr << "Only one input file can be given" << std::endl;
      return 1;
    }
  }

  try {
    CrimpConfig config;
    if (!config_path.empty()) {
      config = CrimpConfig::load(config_path);
    }
    if (print_stats) {
      config.statistics = true;
      config.html.generate_statistics = true;
    }

    if (type.empty()) {
      type = config.type;
    }
    if (type.empty()) {
      type = to_lower(fs::path(input_path).extension().string()) == ".xml"
                 ? "xml"
                 : "html";
    }
    if (type != "html" && type != "xml") {
      throw ConfigError("Unknown type: " + type);
    }

    std::string source = read_input(input_path);

    std::string result;
    std::unique_ptr<HtmlCompressor> html_compressor;
    if (type == "xml") {
      XmlCompressor compressor(config.xml);
      result = compressor.compress(source);
    } else {
      html_compressor = create_html_compressor(config);
      result = html_compressor->compress(source);
    }
    write_output(output_path, result);

    if (!output_path.empty()) {
      log_success(output_path + " (" + std::to_string(source.size()) +
                  " -> " + std::to_string(result.size()) + " bytes)");
    }

    if (html_compressor && config.statistics &&
        html_compressor->statistics()) {
      nlohmann::json stats = *html_compressor->statistics();
      std::cerr << stats.dump(2) << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
