#include "aamva/text_utils.h"
#include <unordered_map>

namespace aamva {
namespace utils {

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();

    while (begin < end && isAsciiSpace(text[begin])) {
        begin++;
    }
    while (end > begin && isAsciiSpace(text[end - 1])) {
        end--;
    }

    return text.substr(begin, end - begin);
}

// Two-byte UTF-8 encodings of U+00C0-U+00FF share the lead byte 0xC3;
// upper and lower case differ by 0x20 in the second byte.
constexpr unsigned char LATIN1_LEAD = 0xC3;
constexpr unsigned char LATIN1_CASE_OFFSET = 0x20;

static bool isLatin1Upper(unsigned char second) {
    return second >= 0x80 && second <= 0x9E && second != 0x97;   // not U+00D7
}

static bool isLatin1Lower(unsigned char second) {
    return second >= 0xA0 && second <= 0xBE && second != 0xB7;   // not U+00F7
}

// Maps the character starting at pos in place; returns its length in bytes
static size_t mapCase(std::string& text, size_t pos, bool upper) {
    if (static_cast<unsigned char>(text[pos]) == LATIN1_LEAD && pos + 1 < text.size()) {
        auto second = static_cast<unsigned char>(text[pos + 1]);
        if (upper && isLatin1Lower(second)) {
            text[pos + 1] = static_cast<char>(second - LATIN1_CASE_OFFSET);
            return 2;
        }
        if (!upper && isLatin1Upper(second)) {
            text[pos + 1] = static_cast<char>(second + LATIN1_CASE_OFFSET);
            return 2;
        }
        if (second >= 0x80 && second <= 0xBF) {
            return 2;
        }
        return 1;
    }

    text[pos] = upper ? toUpperAscii(text[pos]) : toLowerAscii(text[pos]);
    return 1;
}

std::string toUpper(std::string_view text) {
    std::string result(text);
    for (size_t i = 0; i < result.size();) {
        i += mapCase(result, i, true);
    }
    return result;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    for (size_t i = 0; i < result.size();) {
        i += mapCase(result, i, false);
    }
    return result;
}

std::string capitalizeFirst(std::string_view text) {
    std::string result(text);
    if (!result.empty()) {
        mapCase(result, 0, true);
    }
    return result;
}

std::vector<std::string_view> splitWords(std::string_view text) {
    std::vector<std::string_view> words;

    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isAsciiSpace(text[i])) {
            i++;
        }
        size_t start = i;
        while (i < text.size() && !isAsciiSpace(text[i])) {
            i++;
        }
        if (i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }

    return words;
}

std::vector<std::string_view> splitOn(std::string_view text, char delimiter) {
    std::vector<std::string_view> fields;

    size_t start = 0;
    for (size_t i = 0; i <= text.size(); i++) {
        if (i == text.size() || text[i] == delimiter) {
            fields.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }

    return fields;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            result.append(separator);
        }
        result.append(parts[i]);
    }
    return result;
}

std::string titleCaseWords(std::string_view text) {
    std::vector<std::string> words;

    for (auto word : splitWords(text)) {
        std::string lower = toLower(word);

        std::vector<std::string> parts;
        for (auto part : splitOn(lower, '-')) {
            parts.push_back(capitalizeFirst(part));
        }
        words.push_back(join(parts, "-"));
    }

    return join(words, " ");
}

} // namespace utils

namespace normalize {

std::string ZipTrimmer::normalize(std::string_view raw) {
    return std::string(utils::trim(raw));
}

// Street words rendered with fixed casing
static const std::unordered_map<std::string, std::string> ADDRESS_ABBREVIATIONS = {
    {"st", "St"}, {"ave", "Ave"}, {"blvd", "Blvd"}, {"dr", "Dr"},
    {"ln", "Ln"}, {"rd", "Rd"}, {"ct", "Ct"}, {"pl", "Pl"},
    {"cir", "Cir"}, {"way", "Way"}, {"pkwy", "Pkwy"}, {"hwy", "Hwy"},
    {"apt", "Apt"}, {"ste", "Ste"}, {"fl", "Fl"}, {"unit", "Unit"},
    {"n", "N"}, {"s", "S"}, {"e", "E"}, {"w", "W"},
    {"ne", "NE"}, {"nw", "NW"}, {"se", "SE"}, {"sw", "SW"},
    {"po", "PO"}
};

std::string AddressCaser::normalize(std::string_view raw) {
    std::vector<std::string> words;

    for (auto word : utils::splitWords(raw)) {
        std::string lower;
        lower.reserve(word.size());
        for (char c : utils::toLower(word)) {
            if (c != '.') {
                lower.push_back(c);
            }
        }
        if (lower.empty()) {
            continue;
        }

        auto it = ADDRESS_ABBREVIATIONS.find(lower);
        if (it != ADDRESS_ABBREVIATIONS.end()) {
            words.push_back(it->second);
        } else {
            words.push_back(utils::titleCaseWords(lower));
        }
    }

    return utils::join(words, " ");
}

} // namespace normalize
} // namespace aamva
