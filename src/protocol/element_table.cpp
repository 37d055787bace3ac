#include "aamva/element_table.h"

namespace aamva {

struct ElementEntry {
    const char* code;
    ElementId id;
    const char* name;
};

// Indexed by ElementId
static const ElementEntry ELEMENT_TABLE[ELEMENT_COUNT] = {
    {"DCS", ElementId::FAMILY_NAME,     "Family name"},
    {"DAC", ElementId::FIRST_NAME,      "First name"},
    {"DAD", ElementId::MIDDLE_NAME,     "Middle name"},
    {"DAA", ElementId::FULL_NAME,       "Full name"},
    {"DBB", ElementId::DATE_OF_BIRTH,   "Date of birth"},
    {"DAG", ElementId::STREET_ADDRESS,  "Street address"},
    {"DAI", ElementId::CITY,            "City"},
    {"DAJ", ElementId::JURISDICTION,    "Jurisdiction code"},
    {"DAK", ElementId::POSTAL_CODE,     "Postal code"},
    {"DAQ", ElementId::CUSTOMER_ID,     "Customer ID number"},
    {"DBA", ElementId::EXPIRATION_DATE, "Document expiration date"},
    {"DBD", ElementId::ISSUE_DATE,      "Document issue date"},
    {"DAU", ElementId::HEIGHT,          "Height"},
    {"DAY", ElementId::EYE_COLOR,       "Eye color"},
    {"DAB", ElementId::FAMILY_NAME_ALT, "Family name (legacy)"},
    {"DCT", ElementId::GIVEN_NAME_ALT,  "Given name (legacy)"}
};

bool lookupElement(std::string_view code, ElementId& id) {
    if (code.size() != ELEMENT_ID_LENGTH) {
        return false;
    }

    for (const auto& entry : ELEMENT_TABLE) {
        if (code == entry.code) {
            id = entry.id;
            return true;
        }
    }

    return false;
}

const char* elementCode(ElementId id) {
    size_t index = static_cast<size_t>(id);
    return index < ELEMENT_COUNT ? ELEMENT_TABLE[index].code : "???";
}

const char* elementName(ElementId id) {
    size_t index = static_cast<size_t>(id);
    return index < ELEMENT_COUNT ? ELEMENT_TABLE[index].name : "Unknown";
}

} // namespace aamva
