// =============================================================================
// pgen - Check Digit Module
// =============================================================================
// Check digit schemes over decimal digit strings.
//
// The check digit is computed over prefix + candidate digits and appended to
// the candidate to form a code. A conforming scheme must detect:
// - every single-digit substitution
// - every transposition of two adjacent digits
//
// DammChecksum is the default scheme. It uses the order-10 totally
// anti-symmetric quasigroup published by H. Michael Damm, so codes stay
// compatible with previously issued lists.
//
// Usage:
//   DammChecksum damm;
//   char check = damm.checkDigit("100012345");
//   bool ok = damm.validate("1000123456");
// =============================================================================

#ifndef PGEN_ALGO_CHECKSUM_H
#define PGEN_ALGO_CHECKSUM_H

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>

namespace pgen::algo {

// =============================================================================
// Checksum Interface
// =============================================================================

/// @brief Interface for single check digit schemes.
/// @note Implementations must be pure: the same input always yields the same
///       digit. Input is assumed to contain only '0'-'9'.
class IChecksum {
public:
    virtual ~IChecksum() = default;

    /// @brief Compute the check digit for a digit string.
    /// @param digits Decimal digit string (may be empty).
    /// @return Check digit as an ASCII character '0'-'9'.
    [[nodiscard]] virtual char checkDigit(std::string_view digits) const noexcept = 0;

    /// @brief Validate a digit string whose last character is its check digit.
    /// @param digitsWithCheck Digit string including the trailing check digit.
    /// @return true if the trailing digit matches the rest of the string.
    [[nodiscard]] virtual bool validate(std::string_view digitsWithCheck) const noexcept;

    /// @brief Short scheme name for logs and reports.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// =============================================================================
// Damm Checksum
// =============================================================================

/// @brief Damm quasigroup table (row = interim digit, column = input digit).
inline constexpr std::array<std::array<std::uint8_t, 10>, 10> kDammTable = {{
    {{0, 3, 1, 7, 5, 9, 8, 6, 4, 2}},
    {{7, 0, 9, 2, 1, 5, 4, 8, 6, 3}},
    {{4, 2, 0, 6, 8, 7, 1, 3, 5, 9}},
    {{1, 7, 5, 0, 9, 8, 3, 4, 2, 6}},
    {{6, 1, 2, 3, 0, 4, 5, 9, 7, 8}},
    {{3, 6, 7, 4, 2, 0, 9, 5, 8, 1}},
    {{5, 8, 6, 9, 7, 2, 0, 1, 3, 4}},
    {{8, 9, 4, 5, 3, 6, 2, 0, 1, 7}},
    {{9, 4, 3, 8, 6, 1, 7, 2, 0, 5}},
    {{2, 5, 8, 1, 4, 3, 6, 7, 9, 0}},
}};

/// @brief Run the Damm quasigroup over a digit string.
/// @return Final interim digit (0-9). A string ending in its own check digit
///         yields 0.
[[nodiscard]] constexpr std::uint8_t dammInterim(std::string_view digits) noexcept {
    std::uint8_t interim = 0;
    for (char c : digits) {
        interim = kDammTable[interim][static_cast<std::uint8_t>(c - '0')];
    }
    return interim;
}

/// @brief Damm check digit of a digit string, as an ASCII character.
[[nodiscard]] constexpr char dammCheckDigit(std::string_view digits) noexcept {
    return static_cast<char>('0' + dammInterim(digits));
}

/// @brief Damm check digit scheme.
class DammChecksum final : public IChecksum {
public:
    [[nodiscard]] char checkDigit(std::string_view digits) const noexcept override {
        return dammCheckDigit(digits);
    }

    /// @note Damm validation needs no recomputation: the interim over the
    ///       whole string is zero exactly when the check digit matches.
    [[nodiscard]] bool validate(std::string_view digitsWithCheck) const noexcept override {
        return !digitsWithCheck.empty() && dammInterim(digitsWithCheck) == 0;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "damm"; }
};

/// @brief Create the default check digit scheme.
[[nodiscard]] std::unique_ptr<IChecksum> createDefaultChecksum();

}  // namespace pgen::algo

#endif  // PGEN_ALGO_CHECKSUM_H
