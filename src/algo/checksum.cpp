// =============================================================================
// pgen - Check Digit Module Implementation
// =============================================================================

#include "pgen/algo/checksum.h"

namespace pgen::algo {

bool IChecksum::validate(std::string_view digitsWithCheck) const noexcept {
    if (digitsWithCheck.empty()) {
        return false;
    }
    const auto body = digitsWithCheck.substr(0, digitsWithCheck.size() - 1);
    return checkDigit(body) == digitsWithCheck.back();
}

std::unique_ptr<IChecksum> createDefaultChecksum() {
    return std::make_unique<DammChecksum>();
}

}  // namespace pgen::algo
