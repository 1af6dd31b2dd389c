#pragma once
#include <string>
#include <string_view>

namespace ps {

// ASCII whitespace trim.
std::string_view trim(std::string_view s) noexcept;

std::string to_lower(std::string_view s);
bool starts_with(std::string_view s, std::string_view prefix) noexcept;

// True if s is well-formed UTF-8.
bool is_valid_utf8(std::string_view s) noexcept;

// Copy of s with every ill-formed sequence replaced by U+FFFD.
std::string sanitize_utf8(std::string_view s);

}
