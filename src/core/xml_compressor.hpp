#ifndef XML_COMPRESSOR_HPP
#define XML_COMPRESSOR_HPP

#include "compressor.hpp"
#include "compressor_options.hpp"
#include <string>

// Compresses XML by removing comments and unneeded whitespace. CDATA
// sections are preserved as they are.
class XmlCompressor : public Compressor {
public:
  using Options = XmlCompressorOptions;

  explicit XmlCompressor(Options opts = Options());

  std::string compress(const std::string &xml) override;

  const Options &options() const { return opts; }

private:
  Options opts;

  std::string remove_comments(const std::string &xml) const;
  std::string remove_intertag_spaces(const std::string &xml) const;
  std::string remove_spaces_inside_tags(const std::string &xml) const;
};

#endif // XML_COMPRESSOR_HPP
