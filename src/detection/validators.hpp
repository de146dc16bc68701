#ifndef SENSISCAN_DETECTION_VALIDATORS_HPP
#define SENSISCAN_DETECTION_VALIDATORS_HPP

#include <string>

/**
 * @file validators.hpp
 * @brief Structural and checksum validators run on raw pattern hits.
 *
 * A hit whose rule has a validator is emitted only if the validator passes.
 */

namespace sensiscan {
namespace detection {

/**
 * @brief Keep only the ASCII digits of `value`.
 */
inline std::string digitsOnly(const std::string &value)
{
    std::string digits;
    digits.reserve(value.size());
    for (char c : value) {
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
        }
    }
    return digits;
}

/**
 * @brief Luhn checksum over the digits of `value` (separators ignored).
 *
 * Every second digit from the right is doubled, and doubled values above 9
 * have 9 subtracted. Valid iff the total is divisible by 10 and the number
 * has 13 to 19 digits.
 */
inline bool luhnCheck(const std::string &value)
{
    const std::string digits = digitsOnly(value);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int d = *it - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

/**
 * @brief Issuer prefix check for Visa, Mastercard, Amex, Discover and Diners.
 */
inline bool hasKnownCardPrefix(const std::string &digits)
{
    if (digits.empty()) {
        return false;
    }
    auto prefix = [&](size_t n) { return digits.size() >= n ? std::stoi(digits.substr(0, n)) : -1; };

    const size_t len = digits.size();
    if (digits[0] == '4') {
        return len == 13 || len == 16 || len == 19;              // Visa
    }
    int p2 = prefix(2);
    int p3 = prefix(3);
    int p4 = prefix(4);
    if (p2 >= 51 && p2 <= 55) {
        return len == 16;                                        // Mastercard
    }
    if (p4 >= 2221 && p4 <= 2720) {
        return len == 16;                                        // Mastercard 2-series
    }
    if (p2 == 34 || p2 == 37) {
        return len == 15;                                        // Amex
    }
    if (p4 == 6011 || p2 == 65) {
        return len >= 16 && len <= 19;                           // Discover
    }
    if ((p3 >= 300 && p3 <= 305) || p2 == 36 || p2 == 38) {
        return len >= 14 && len <= 19;                           // Diners
    }
    return false;
}

/**
 * @brief Card validator: known issuer prefix and a passing Luhn checksum.
 */
inline bool validateCardNumber(const std::string &value)
{
    return hasKnownCardPrefix(digitsOnly(value)) && luhnCheck(value);
}

/**
 * @brief US SSN structure: nine digits, area not 000/666/9xx, group not 00,
 *        serial not 0000.
 */
inline bool validateSsn(const std::string &value)
{
    const std::string digits = digitsOnly(value);
    if (digits.size() != 9) {
        return false;
    }
    int area = std::stoi(digits.substr(0, 3));
    int group = std::stoi(digits.substr(3, 2));
    int serial = std::stoi(digits.substr(5, 4));

    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (group == 0) {
        return false;
    }
    return serial != 0;
}

} // namespace detection
} // namespace sensiscan

#endif // SENSISCAN_DETECTION_VALIDATORS_HPP
