#ifndef AAMVA_NAME_CASER_H
#define AAMVA_NAME_CASER_H

#include <optional>
#include <string>
#include <string_view>

namespace aamva {
namespace normalize {

/**
 * Renders upper-case AAMVA names in conventional mixed case
 *
 * - Words split on whitespace and hyphens, each title-cased
 * - MCDONALD -> McDonald, O'BRIEN -> O'Brien
 * - After the first word, particles (de, la, van, von, del, der) stay
 *   lower-case and generational suffixes (II, III, IV, JR, SR) upper-case
 *
 * Letters are cased in ASCII and the UTF-8 Latin-1 range (MUÑOZ -> Muñoz);
 * other non-ASCII characters pass through unchanged.
 *
 * normalize(normalize(x)) == normalize(x).
 */
class NameCaser {
public:
    static std::string normalize(std::string_view raw);

private:
    static std::string capitalizeWord(std::string_view lower_word);
    static std::string capitalizeSegment(std::string_view lower_segment);
};

// Components of a composite DAA name
struct SplitName {
    std::optional<std::string> last;
    std::optional<std::string> first;
    std::optional<std::string> middle;
};

/**
 * Splits a composite DAA value: LAST,FIRST[,MIDDLE]
 *
 * Segments are trimmed and passed through NameCaser; empty segments are
 * absent. In the two-segment form LAST,FIRST MIDDLE the first word of the
 * second segment is the first name and the rest is the middle name.
 */
class FullNameSplitter {
public:
    static SplitName split(std::string_view composite);

    // Name-cases each comma segment and rejoins them: "DOE, JANE" -> "Doe,Jane"
    static std::string normalize(std::string_view composite);
};

} // namespace normalize
} // namespace aamva

#endif // AAMVA_NAME_CASER_H
