#include "aamva/name_caser.h"
#include "aamva/text_utils.h"
#include <vector>

namespace aamva {
namespace normalize {

// Surname particles kept lower-case after the first word
static const char* NAME_PARTICLES[] = {
    "de", "la", "van", "von", "del", "der"
};

// Generational suffixes kept upper-case after the first word
static const char* NAME_SUFFIXES[] = {
    "ii", "iii", "iv", "jr", "sr"
};

template <size_t N>
static bool contains(const char* (&table)[N], std::string_view word) {
    for (const char* entry : table) {
        if (word == entry) {
            return true;
        }
    }
    return false;
}

std::string NameCaser::normalize(std::string_view raw) {
    std::vector<std::string> words;

    auto tokens = utils::splitWords(raw);
    for (size_t i = 0; i < tokens.size(); i++) {
        std::string lower = utils::toLower(tokens[i]);

        if (i > 0 && contains(NAME_PARTICLES, lower)) {
            words.push_back(lower);
        } else if (i > 0 && contains(NAME_SUFFIXES, lower)) {
            words.push_back(utils::toUpper(lower));
        } else {
            words.push_back(capitalizeWord(lower));
        }
    }

    return utils::join(words, " ");
}

std::string NameCaser::capitalizeWord(std::string_view lower_word) {
    std::string result;

    auto parts = utils::splitOn(lower_word, '-');
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            result.push_back('-');
        }
        result += capitalizeSegment(parts[i]);
    }

    return result;
}

std::string NameCaser::capitalizeSegment(std::string_view lower_segment) {
    std::string result;

    // O'BRIEN: every apostrophe starts a new capitalized part
    auto parts = utils::splitOn(lower_segment, '\'');
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            result.push_back('\'');
        }

        std::string_view part = parts[i];
        if (part.empty()) {
            continue;
        }

        if (part.size() > 2 && part.substr(0, 2) == "mc") {
            result += "Mc";
            result += utils::capitalizeFirst(part.substr(2));
        } else {
            result += utils::capitalizeFirst(part);
        }
    }

    return result;
}

SplitName FullNameSplitter::split(std::string_view composite) {
    SplitName name;

    auto segments = utils::splitOn(composite, ',');

    auto segmentAt = [&segments](size_t index) -> std::string_view {
        return index < segments.size() ? utils::trim(segments[index]) : std::string_view();
    };

    std::string_view last = segmentAt(0);
    std::string_view first = segmentAt(1);
    std::string_view middle = segmentAt(2);

    // LAST,FIRST MIDDLE
    if (segments.size() == 2) {
        auto words = utils::splitWords(first);
        if (words.size() > 1) {
            first = words.front();
            middle = utils::trim(segmentAt(1).substr(words.front().size()));
        }
    }

    if (!last.empty()) {
        name.last = NameCaser::normalize(last);
    }
    if (!first.empty()) {
        name.first = NameCaser::normalize(first);
    }
    if (!middle.empty()) {
        name.middle = NameCaser::normalize(middle);
    }

    return name;
}

std::string FullNameSplitter::normalize(std::string_view composite) {
    std::vector<std::string> segments;
    for (auto segment : utils::splitOn(composite, ',')) {
        segments.push_back(NameCaser::normalize(segment));
    }

    // Trailing empty segments carry nothing
    while (!segments.empty() && segments.back().empty()) {
        segments.pop_back();
    }

    return utils::join(segments, ",");
}

} // namespace normalize
} // namespace aamva
