#ifndef AAMVA_H
#define AAMVA_H

// AAMVA DL/ID Decoder - Main include header
// Include this file to access all decoder functionality

#include "aamva/types.h"
#include "aamva/parser.h"
#include "aamva/identity_format.h"

namespace aamva {

// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace aamva

#endif // AAMVA_H
