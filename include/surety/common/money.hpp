#pragma once

#include <surety/common/error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace surety {

    /// Integer currency subunits (cents). All monetary fields use this.
    using Money = dp::i64;

    /// Milliseconds since the Unix epoch
    using Millis = dp::i64;

    /// Injectable time source
    using Clock = std::function<Millis()>;

    inline Millis currentMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Parse a decimal string of minor units. Anything but a plain non-negative
    /// integer ("10.50", "-1", "1e3", " 5") is rejected, never rounded.
    inline dp::Result<Money, dp::Error> parseMinorUnits(const std::string &text) {
        if (text.empty()) {
            return dp::Result<Money, dp::Error>::err(validation_error("Amount is empty"));
        }
        Money value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                return dp::Result<Money, dp::Error>::err(
                    validation_error("Amount '" + text + "' is not an integer minor-unit value"));
            }
            Money digit = c - '0';
            if (value > (std::numeric_limits<Money>::max() - digit) / 10) {
                return dp::Result<Money, dp::Error>::err(validation_error("Amount '" + text + "' overflows"));
            }
            value = value * 10 + digit;
        }
        return dp::Result<Money, dp::Error>::ok(value);
    }

    /// ISO-4217 shape: three uppercase ASCII letters
    inline bool isValidCurrency(const std::string &currency) {
        if (currency.size() != 3)
            return false;
        for (char c : currency) {
            if (c < 'A' || c > 'Z')
                return false;
        }
        return true;
    }

    /// Overflow-checked addition; returns false instead of wrapping
    inline bool checkedAdd(Money a, Money b, Money &out) {
        if ((b > 0 && a > std::numeric_limits<Money>::max() - b) ||
            (b < 0 && a < std::numeric_limits<Money>::min() - b)) {
            return false;
        }
        out = a + b;
        return true;
    }

    inline dp::Result<void, dp::Error> requireNonNegative(Money amount, const std::string &field) {
        if (amount < 0) {
            return dp::Result<void, dp::Error>::err(
                validation_error(field + " must be >= 0, got " + std::to_string(amount)));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<void, dp::Error> requirePositive(Money amount, const std::string &field) {
        if (amount <= 0) {
            return dp::Result<void, dp::Error>::err(
                validation_error(field + " must be > 0, got " + std::to_string(amount)));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace surety
