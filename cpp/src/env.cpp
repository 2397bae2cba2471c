#include "sealstream/env.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace sealstream::env {

namespace {

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    for (std::string_view truthy : {"1", "true", "yes", "on"}) {
        if (EqualsIgnoreCase(value, truthy)) {
            return true;
        }
    }
    return false;
}

std::optional<std::uint32_t> PositiveUint32(std::initializer_list<std::string_view> names) {
    for (std::string_view name : names) {
        std::string raw = Get(name);
        if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw.front()))) {
            continue;
        }
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(raw.c_str(), &end, 10);
        if (*end != '\0' || parsed == 0) {
            continue;
        }
        if (parsed > std::numeric_limits<std::uint32_t>::max()) {
            return std::numeric_limits<std::uint32_t>::max();
        }
        return static_cast<std::uint32_t>(parsed);
    }
    return std::nullopt;
}

std::string HomeDir() {
    std::string home = Get("HOME");
    if (home.empty()) {
        home = Get("USERPROFILE");
    }
    return home;
}

}  // namespace sealstream::env
