#ifndef COMPRESSOR_HPP
#define COMPRESSOR_HPP

#include <stdexcept>
#include <string>

// Anything that turns source text into a smaller equivalent. Implementations
// return the original text when they cannot process it.
class Compressor {
public:
  virtual ~Compressor() = default;

  virtual std::string compress(const std::string &source) = 0;
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

#endif // COMPRESSOR_HPP
