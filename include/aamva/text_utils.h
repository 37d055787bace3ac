#ifndef AAMVA_TEXT_UTILS_H
#define AAMVA_TEXT_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace aamva {
namespace utils {

// ASCII helpers; bytes outside ASCII pass through unchanged
inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

inline bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

inline bool isAsciiUpper(char c) {
    return c >= 'A' && c <= 'Z';
}

inline bool isAsciiLower(char c) {
    return c >= 'a' && c <= 'z';
}

inline char toUpperAscii(char c) {
    return isAsciiLower(c) ? static_cast<char>(c - 'a' + 'A') : c;
}

inline char toLowerAscii(char c) {
    return isAsciiUpper(c) ? static_cast<char>(c - 'A' + 'a') : c;
}

// Strip surrounding whitespace
std::string_view trim(std::string_view text);

// Case mapping covers ASCII and the UTF-8 Latin-1 letters (U+00C0-U+00FE,
// e.g. Ñ/ñ); any other byte is copied unchanged.
std::string toUpper(std::string_view text);
std::string toLower(std::string_view text);

// Upper-case the first character only: "muñoz" -> "Muñoz", "ñu" -> "Ñu"
std::string capitalizeFirst(std::string_view text);

// Split on whitespace runs; no empty words
std::vector<std::string_view> splitWords(std::string_view text);

// Split on a delimiter; keeps empty fields
std::vector<std::string_view> splitOn(std::string_view text, char delimiter);

// Join with a separator
std::string join(const std::vector<std::string>& parts, std::string_view separator);

// "WINSTON-SALEM" -> "Winston-Salem"
std::string titleCaseWords(std::string_view text);

} // namespace utils

namespace normalize {

// Trims padding from a postal code; content is kept as-is
class ZipTrimmer {
public:
    static std::string normalize(std::string_view raw);
};

// "123 MAIN ST." -> "123 Main St"
class AddressCaser {
public:
    static std::string normalize(std::string_view raw);
};

} // namespace normalize
} // namespace aamva

#endif // AAMVA_TEXT_UTILS_H
