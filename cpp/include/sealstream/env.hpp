#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace sealstream::env {

// Empty when the variable is unset.
std::string Get(std::string_view name);

// "1", "true", "yes" and "on" (any case) count as set.
bool IsEnabled(std::string_view name, bool default_value = false);

// First of the named variables holding a positive integer; values above
// uint32 max are clamped. Unset, zero and unparsable values are skipped.
std::optional<std::uint32_t> PositiveUint32(std::initializer_list<std::string_view> names);

std::string HomeDir();

}  // namespace sealstream::env
