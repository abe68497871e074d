#pragma once

#include <string>
#include <string_view>

namespace batchnet::util {

std::string_view trim_ws(std::string_view s);

// ASCII-only case folding; header names and schemes never need more.
std::string to_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);

bool starts_with(std::string_view s, std::string_view prefix);

} // namespace batchnet::util
