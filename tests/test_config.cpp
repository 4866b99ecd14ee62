#include "utils/config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace {

class CrimpConfigTest : public testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("crimp_config_test_" +
           std::string(testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name()));
    fs::create_directories(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  fs::path WriteFile(const std::string &name, const std::string &content) {
    fs::path path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
  }

  static CrimpConfig Parse(const std::string &yaml) {
    return CrimpConfig::from_yaml(YAML::Load(yaml));
  }

  fs::path dir;
};

TEST_F(CrimpConfigTest, Defaults) {
  CrimpConfig config = Parse("{}");
  EXPECT_EQ("", config.type);
  EXPECT_EQ("basic", config.js_compressor);
  EXPECT_FALSE(config.statistics);
  EXPECT_TRUE(config.html.enabled);
  EXPECT_TRUE(config.html.remove_comments);
  EXPECT_TRUE(config.html.remove_multi_spaces);
  EXPECT_FALSE(config.html.remove_intertag_spaces);
  EXPECT_FALSE(config.html.compress_javascript);
  EXPECT_TRUE(config.html.preserve_patterns.empty());
  EXPECT_TRUE(config.xml.remove_comments);
  EXPECT_TRUE(config.xml.remove_intertag_spaces);
}

TEST_F(CrimpConfigTest, ReadsSections) {
  CrimpConfig config = Parse(R"(
type: html
statistics: true
html:
  remove_comments: false
  remove_intertag_spaces: true
  remove_quotes: true
  compress_js: true
  compress_css: true
  remove_surrounding_spaces: max
xml:
  remove_comments: false
)");

  EXPECT_EQ("html", config.type);
  EXPECT_TRUE(config.statistics);
  EXPECT_TRUE(config.html.generate_statistics);
  EXPECT_FALSE(config.html.remove_comments);
  EXPECT_TRUE(config.html.remove_intertag_spaces);
  EXPECT_TRUE(config.html.remove_quotes);
  EXPECT_TRUE(config.html.compress_javascript);
  EXPECT_TRUE(config.html.compress_css);
  EXPECT_EQ("max", config.html.remove_surrounding_spaces);
  EXPECT_FALSE(config.xml.remove_comments);
  EXPECT_TRUE(config.xml.remove_intertag_spaces);
}

TEST_F(CrimpConfigTest, PreservePatternOrder) {
  CrimpConfig config = Parse(R"(
preserve_php: true
preserve_ssi: true
preserve_patterns:
  - '\{\{[^}]*\}\}'
)");

  ASSERT_EQ(3u, config.html.preserve_patterns.size());
  EXPECT_EQ(PreservePattern::php_tags().expression(),
            config.html.preserve_patterns[0].expression());
  EXPECT_EQ(PreservePattern::server_side_includes().expression(),
            config.html.preserve_patterns[1].expression());
  EXPECT_EQ(R"(\{\{[^}]*\}\})", config.html.preserve_patterns[2].expression());
}

TEST_F(CrimpConfigTest, InvalidPatternIsRejected) {
  EXPECT_THROW(Parse("preserve_patterns: ['(unclosed']"), ConfigError);
}

TEST_F(CrimpConfigTest, UnknownType) {
  EXPECT_THROW(Parse("type: json"), ConfigError);
}

TEST_F(CrimpConfigTest, UnknownJsCompressor) {
  EXPECT_THROW(Parse("js_compressor: closure"), ConfigError);
}

TEST_F(CrimpConfigTest, QuickJsNeedsBundle) {
  EXPECT_THROW(Parse("js_compressor: quickjs"), ConfigError);
}

TEST_F(CrimpConfigTest, BadValueType) {
  EXPECT_THROW(Parse("statistics: [1, 2]"), ConfigError);
}

TEST_F(CrimpConfigTest, LoadResolvesRelativePaths) {
  WriteFile("patterns.txt", "<\\?php[\\s\\S]*?\\?>\r\n\n\\{%[\\s\\S]*?%\\}\n");
  fs::path config_path = WriteFile("crimp.yaml", R"(
js_compressor: quickjs
minifier_bundle: minifiers.js
preserve_patterns_file: patterns.txt
)");

  CrimpConfig config = CrimpConfig::load(config_path);
  EXPECT_EQ((dir / "minifiers.js").string(), config.minifier_bundle);
  ASSERT_EQ(2u, config.html.preserve_patterns.size());
  EXPECT_EQ(R"(\{%[\s\S]*?%\})",
            config.html.preserve_patterns[1].expression());
}

TEST_F(CrimpConfigTest, MissingConfigFile) {
  EXPECT_THROW(CrimpConfig::load(dir / "missing.yaml"), ConfigError);
}

TEST_F(CrimpConfigTest, MissingPatternsFile) {
  fs::path config_path =
      WriteFile("crimp.yaml", "preserve_patterns_file: nowhere.txt\n");
  EXPECT_THROW(CrimpConfig::load(config_path), ConfigError);
}

TEST_F(CrimpConfigTest, MalformedYaml) {
  fs::path config_path = WriteFile("crimp.yaml", "html: [unclosed\n");
  EXPECT_THROW(CrimpConfig::load(config_path), ConfigError);
}

} // namespace
