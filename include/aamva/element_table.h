#ifndef AAMVA_ELEMENT_TABLE_H
#define AAMVA_ELEMENT_TABLE_H

#include "aamva/types.h"
#include <cstddef>
#include <string_view>

namespace aamva {

// Length of every element identifier ("DCS", "DBB", ...)
constexpr size_t ELEMENT_ID_LENGTH = 3;

// Look up a 3-character element code
// Returns false for codes outside the closed set (not an error)
bool lookupElement(std::string_view code, ElementId& id);

// Three-letter code for an element, e.g. "DCS"
const char* elementCode(ElementId id);

// Human readable element name, e.g. "Family name"
const char* elementName(ElementId id);

} // namespace aamva

#endif // AAMVA_ELEMENT_TABLE_H
