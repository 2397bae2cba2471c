#include "sealstream/cli_colors.hpp"

#include "sealstream/env.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace sealstream::cli {

namespace {
    bool g_colors_forced = false;
    bool g_colors_enabled = true;
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_forced) {
        return g_colors_enabled;
    }
    if (sealstream::env::IsEnabled("SEALSTREAM_NO_COLOR")) {
        return false;
    }
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_forced = true;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace sealstream::cli
