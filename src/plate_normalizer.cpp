#include "redlight/plate_normalizer.hpp"

#include <cctype>

#include "redlight/types.hpp"

namespace redlight {

std::string normalizePlate(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc)) {
            continue;
        }
        char upper = static_cast<char>(std::toupper(uc));
        switch (upper) {
        case 'O': upper = '0'; break;
        case 'I': upper = '1'; break;
        case 'Z': upper = '2'; break;
        default: break;
        }
        out.push_back(upper);
    }
    return out;
}

std::string recordPlate(const std::string& normalized) {
    if (normalized.empty()) {
        return kUnknownPlate;
    }
    if (normalized.size() > kMaxPlateLength) {
        return normalized.substr(0, kMaxPlateLength);
    }
    return normalized;
}

}  // namespace redlight
