#include "TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace scout {

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    auto b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;

    // Find the lead byte of the last character that starts before the cut.
    size_t lead = length;
    while (lead > 0 && (static_cast<unsigned char>(str[lead - 1]) & 0xC0) == 0x80) --lead;
    if (lead == 0) return str.substr(0, length);
    --lead;

    unsigned char c = static_cast<unsigned char>(str[lead]);
    size_t width = 1;
    if (c >= 0xF0) width = 4;
    else if (c >= 0xE0) width = 3;
    else if (c >= 0xC0) width = 2;

    // Keep the character only when all of its bytes fit.
    if (lead + width <= length) return str.substr(0, length);
    return str.substr(0, lead);
}

} // namespace scout
