#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace ledger::domain {

/**
 * @brief Десятичное число с фиксированной точкой (18 знаков после запятой)
 *
 * Развитие идеи Money (units + nano): значение хранится одним целым числом
 * в единицах 10^-18, поэтому сложение и вычитание точные, а умножение
 * и деление округляются на 18-м знаке (half away from zero).
 * Двоичная плавающая точка не используется нигде.
 *
 * Пример: 0.1 BTC = {raw: 100000000000000000}
 *
 * Диапазон: примерно ±1.7e20 целых единиц.
 * - переполнение → std::overflow_error
 * - деление на ноль → std::domain_error
 */
class Decimal {
public:
    using Raw = boost::multiprecision::checked_int128_t;
    using Wide = boost::multiprecision::checked_int256_t;

    static constexpr int SCALE = 18;

    Decimal() = default;

    static Decimal fromRaw(const Raw& raw);
    static Decimal fromInt(int64_t units);

    /**
     * @brief Разобрать строку вида "-123.456"
     * @throws std::invalid_argument если строка не является числом
     */
    static Decimal fromString(const std::string& text);

    /**
     * @brief Разобрать строку, nullopt при ошибке формата или переполнении
     *
     * Знаки после 18-го округляются.
     */
    static std::optional<Decimal> tryParse(const std::string& text);

    static Decimal zero() { return Decimal(); }
    static Decimal one() { return fromInt(1); }

    const Raw& raw() const { return raw_; }

    /**
     * @brief Каноническая запись без хвостовых нулей ("0.2", "55000")
     */
    std::string toString() const;

    /**
     * @brief Запись ровно с places знаками после запятой (для отображения)
     */
    std::string toFixed(int places) const;

    /**
     * @brief Округлить до places знаков (half away from zero)
     */
    Decimal round(int places) const;

    bool isZero() const { return raw_ == 0; }
    bool isNegative() const { return raw_ < 0; }
    bool isPositive() const { return raw_ > 0; }
    Decimal abs() const;

    Decimal operator-() const;
    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    Raw raw_ = 0;

    static const Raw& scaleFactor();
    static Wide pow10(int exponent);
    static Raw narrow(const Wide& value);
    static Wide roundedDiv(const Wide& numerator, const Wide& denominator);
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace ledger::domain
