#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace sealstream::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
}

// Auto-detected from the stream being a TTY unless SEALSTREAM_NO_COLOR is set
// or SetColorsEnabled was called.
bool ColorsEnabled(std::ostream& os = std::cout);
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Green(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::GREEN, os); }
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::YELLOW, os); }
inline std::string Cyan(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::CYAN, os); }
inline std::string BoldRed(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_RED, os); }

}  // namespace sealstream::cli
