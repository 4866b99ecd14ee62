#ifndef LOG_HPP
#define LOG_HPP

#include <iostream>
#include <string>
#include <termcolor/termcolor.hpp>

inline void log_warning(const std::string &message) {
  std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

inline void log_error(const std::string &message) {
  std::cerr << termcolor::red << "✗ Error: " << termcolor::reset << message
            << "\n";
}

inline void log_success(const std::string &message) {
  std::cerr << termcolor::bright_green << "✓ " << termcolor::reset << message
            << "\n";
}

#endif // LOG_HPP
