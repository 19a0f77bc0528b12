#pragma once
#include <string>

namespace scout {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Truncates to at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

} // namespace scout
