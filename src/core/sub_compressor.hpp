#ifndef SUB_COMPRESSOR_HPP
#define SUB_COMPRESSOR_HPP

#include "compressor.hpp"
#include <memory>
#include <string>
#include <vector>

// Hands extracted script or style blocks to a pluggable Compressor. CDATA
// wrappers are kept around the compressed text. A missing compressor or a
// failing one leaves the block as it was.
class SubCompressor {
private:
  std::string label;
  std::shared_ptr<Compressor> compressor;

public:
  SubCompressor(std::string label, std::shared_ptr<Compressor> compressor);

  std::string compress(const std::string &block) const;
  void compress_all(std::vector<std::string> &blocks) const;

  bool available() const { return compressor != nullptr; }
};

#endif // SUB_COMPRESSOR_HPP
