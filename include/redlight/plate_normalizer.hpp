#pragma once

#include <string>

namespace redlight {

// Keeps alphanumerics, upper-cases, then maps the letters OCR confuses with
// digits: 'O' -> '0', 'I' -> '1', 'Z' -> '2'.
std::string normalizePlate(const std::string& raw);

// Plate as carried by a ViolationRecord: normalized, UNKNOWN when nothing
// survives normalization, and at most kMaxPlateLength characters.
std::string recordPlate(const std::string& normalized);

}  // namespace redlight
