#include "domain/Decimal.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace ledger::domain {

const Decimal::Raw& Decimal::scaleFactor() {
    static const Raw factor(1000000000000000000LL);
    return factor;
}

Decimal::Wide Decimal::pow10(int exponent) {
    Wide result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

Decimal::Raw Decimal::narrow(const Wide& value) {
    static const Wide maxRaw = Wide(std::numeric_limits<Raw>::max());
    static const Wide minRaw = Wide(std::numeric_limits<Raw>::min());
    if (value > maxRaw || value < minRaw) {
        throw std::overflow_error("Decimal overflow");
    }
    return Raw(value);
}

Decimal::Wide Decimal::roundedDiv(const Wide& numerator, const Wide& denominator) {
    if (denominator == 0) {
        throw std::domain_error("Division by zero");
    }

    Wide quotient = numerator / denominator;
    Wide remainder = numerator % denominator;

    // half away from zero
    if (remainder != 0 && boost::multiprecision::abs(remainder) * 2 >= boost::multiprecision::abs(denominator)) {
        quotient += ((numerator < 0) != (denominator < 0)) ? -1 : 1;
    }
    return quotient;
}

Decimal Decimal::fromRaw(const Raw& raw) {
    Decimal value;
    value.raw_ = raw;
    return value;
}

Decimal Decimal::fromInt(int64_t units) {
    return fromRaw(narrow(Wide(units) * Wide(scaleFactor())));
}

Decimal Decimal::fromString(const std::string& text) {
    auto parsed = tryParse(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }
    return *parsed;
}

std::optional<Decimal> Decimal::tryParse(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    static const Wide limit = Wide(std::numeric_limits<Raw>::max());

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        pos = 1;
    }

    Wide integer = 0;
    Wide fraction = 0;
    int fractionDigits = 0;
    bool seenPoint = false;
    bool seenDigit = false;
    bool roundUp = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seenPoint) {
                return std::nullopt;
            }
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }

        seenDigit = true;
        int digit = c - '0';

        if (!seenPoint) {
            integer = integer * 10 + digit;
            if (integer > limit) {
                return std::nullopt;
            }
        } else if (fractionDigits < SCALE) {
            fraction = fraction * 10 + digit;
            ++fractionDigits;
        } else if (fractionDigits == SCALE) {
            // 19-й знак решает округление, остальные отбрасываются
            roundUp = digit >= 5;
            ++fractionDigits;
        }
    }

    if (!seenDigit) {
        return std::nullopt;
    }

    if (fractionDigits < SCALE) {
        fraction *= pow10(SCALE - fractionDigits);
    }

    Wide value = integer * Wide(scaleFactor()) + fraction + (roundUp ? 1 : 0);
    if (value > limit) {
        return std::nullopt;
    }
    if (negative) {
        value = -value;
    }
    return fromRaw(Raw(value));
}

Decimal Decimal::round(int places) const {
    if (places >= SCALE) {
        return *this;
    }
    if (places < 0) {
        places = 0;
    }
    Wide factor = pow10(SCALE - places);
    return fromRaw(narrow(roundedDiv(Wide(raw_), factor) * factor));
}

std::string Decimal::toFixed(int places) const {
    if (places > SCALE) {
        places = SCALE;
    }
    if (places < 0) {
        places = 0;
    }

    Raw rounded = round(places).raw_;
    bool negative = rounded < 0;
    Raw magnitude = negative ? Raw(-rounded) : rounded;

    Raw integer = magnitude / scaleFactor();
    Raw fraction = magnitude % scaleFactor();

    std::string result = negative ? "-" : "";
    result += integer.str();

    if (places > 0) {
        std::string digits = fraction.str();
        digits.insert(0, SCALE - digits.size(), '0');
        result += ".";
        result += digits.substr(0, places);
    }
    return result;
}

std::string Decimal::toString() const {
    std::string text = toFixed(SCALE);
    auto last = text.find_last_not_of('0');
    if (text[last] == '.') {
        --last;
    }
    text.erase(last + 1);
    return text == "-0" ? "0" : text;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::operator-() const {
    return fromRaw(Raw(-raw_));
}

Decimal Decimal::operator+(const Decimal& other) const {
    return fromRaw(narrow(Wide(raw_) + Wide(other.raw_)));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return fromRaw(narrow(Wide(raw_) - Wide(other.raw_)));
}

Decimal Decimal::operator*(const Decimal& other) const {
    Wide product = Wide(raw_) * Wide(other.raw_);
    return fromRaw(narrow(roundedDiv(product, Wide(scaleFactor()))));
}

Decimal Decimal::operator/(const Decimal& other) const {
    Wide scaled = Wide(raw_) * Wide(scaleFactor());
    return fromRaw(narrow(roundedDiv(scaled, Wide(other.raw_))));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace ledger::domain
