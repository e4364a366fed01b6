#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <algorithm>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Десятичное число произвольной точности
 *
 * Хранит значение как целую мантиссу и количество знаков после запятой:
 * value = mantissa / 10^scale. Используется для всех количеств и денежных
 * сумм, double не используется нигде.
 *
 * - Сложение, вычитание и умножение точные
 * - Деление округляется (half away from zero) до kDivisionScale знаков
 * - Округление для отображения только через round() / toString(places)
 *
 * После каждой операции хвостовые нули мантиссы отбрасываются, поэтому
 * 1.50 и 1.5 имеют одинаковое представление.
 */
class Decimal {
public:
    using Integer = boost::multiprecision::cpp_int;

    static constexpr unsigned kDivisionScale = 18;

    Decimal() = default;

    Decimal(int64_t value) : mantissa_(value), scale_(0) {}

    explicit Decimal(const std::string& text) {
        *this = parse(text);
    }

    /**
     * @brief Разобрать строку вида "-12.345"
     * @throws std::invalid_argument при неверном формате
     */
    static Decimal parse(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Empty decimal string");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        std::string digits;
        unsigned scale = 0;
        bool seenPoint = false;
        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seenPoint) {
                    throw std::invalid_argument("Invalid decimal: " + text);
                }
                seenPoint = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid decimal: " + text);
            }
            digits.push_back(c);
            if (seenPoint) {
                ++scale;
            }
        }

        if (digits.empty()) {
            throw std::invalid_argument("Invalid decimal: " + text);
        }

        Decimal result;
        result.mantissa_ = Integer(digits);
        if (negative) {
            result.mantissa_ = -result.mantissa_;
        }
        result.scale_ = scale;
        result.normalize();
        return result;
    }

    static Decimal zero() { return Decimal(); }

    bool isZero() const { return mantissa_ == 0; }
    bool isNegative() const { return mantissa_ < 0; }
    bool isPositive() const { return mantissa_ > 0; }
    unsigned scale() const { return scale_; }

    Decimal abs() const {
        Decimal result = *this;
        if (result.mantissa_ < 0) {
            result.mantissa_ = -result.mantissa_;
        }
        return result;
    }

    Decimal operator-() const {
        Decimal result = *this;
        result.mantissa_ = -result.mantissa_;
        return result;
    }

    Decimal operator+(const Decimal& other) const {
        Decimal result;
        result.scale_ = std::max(scale_, other.scale_);
        result.mantissa_ = rescaled(result.scale_) + other.rescaled(result.scale_);
        result.normalize();
        return result;
    }

    Decimal operator-(const Decimal& other) const {
        return *this + (-other);
    }

    Decimal operator*(const Decimal& other) const {
        Decimal result;
        result.mantissa_ = mantissa_ * other.mantissa_;
        result.scale_ = scale_ + other.scale_;
        result.normalize();
        return result;
    }

    /**
     * @brief Деление с округлением до заданного числа знаков
     * @throws std::domain_error при делении на ноль
     */
    Decimal divide(const Decimal& divisor, unsigned places = kDivisionScale) const {
        if (divisor.isZero()) {
            throw std::domain_error("Decimal division by zero");
        }

        // q = (m1 / 10^s1) / (m2 / 10^s2) * 10^places
        Integer numerator = mantissa_;
        Integer denominator = divisor.mantissa_;
        int64_t exponent = static_cast<int64_t>(places) + divisor.scale_ - scale_;
        if (exponent >= 0) {
            numerator *= pow10(static_cast<unsigned>(exponent));
        } else {
            denominator *= pow10(static_cast<unsigned>(-exponent));
        }

        Decimal result;
        result.mantissa_ = roundedQuotient(numerator, denominator);
        result.scale_ = places;
        result.normalize();
        return result;
    }

    Decimal operator/(const Decimal& divisor) const {
        return divide(divisor);
    }

    Decimal& operator+=(const Decimal& other) { return *this = *this + other; }
    Decimal& operator-=(const Decimal& other) { return *this = *this - other; }
    Decimal& operator*=(const Decimal& other) { return *this = *this * other; }

    /**
     * @brief Округлить до places знаков (half away from zero)
     */
    Decimal round(unsigned places) const {
        if (scale_ <= places) {
            return *this;
        }
        Decimal result;
        result.mantissa_ = roundedQuotient(mantissa_, pow10(scale_ - places));
        result.scale_ = places;
        result.normalize();
        return result;
    }

    int compare(const Decimal& other) const {
        unsigned common = std::max(scale_, other.scale_);
        Integer lhs = rescaled(common);
        Integer rhs = other.rescaled(common);
        if (lhs < rhs) return -1;
        if (lhs > rhs) return 1;
        return 0;
    }

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

    static Decimal min(const Decimal& a, const Decimal& b) { return a <= b ? a : b; }
    static Decimal max(const Decimal& a, const Decimal& b) { return a >= b ? a : b; }

    /**
     * @brief Каноническое представление без лишних нулей ("106.5", "-3")
     */
    std::string toString() const {
        return format(mantissa_, scale_);
    }

    /**
     * @brief Представление с фиксированным числом знаков ("106.67")
     */
    std::string toString(unsigned places) const {
        Decimal rounded = round(places);
        Integer padded = rounded.mantissa_ * pow10(places - rounded.scale_);
        return format(padded, places);
    }

private:
    Integer mantissa_ = 0;
    unsigned scale_ = 0;

    static Integer pow10(unsigned n) {
        Integer result = 1;
        for (unsigned i = 0; i < n; ++i) {
            result *= 10;
        }
        return result;
    }

    Integer rescaled(unsigned targetScale) const {
        return mantissa_ * pow10(targetScale - scale_);
    }

    static Integer roundedQuotient(const Integer& numerator, const Integer& denominator) {
        Integer quotient = numerator / denominator;
        Integer remainder = numerator % denominator;
        Integer twice = remainder * 2;
        if (twice < 0) twice = -twice;
        Integer absDenominator = denominator < 0 ? Integer(-denominator) : denominator;
        if (twice >= absDenominator) {
            bool negative = (numerator < 0) != (denominator < 0);
            quotient += negative ? -1 : 1;
        }
        return quotient;
    }

    void normalize() {
        if (mantissa_ == 0) {
            scale_ = 0;
            return;
        }
        while (scale_ > 0 && mantissa_ % 10 == 0) {
            mantissa_ /= 10;
            --scale_;
        }
    }

    static std::string format(const Integer& mantissa, unsigned scale) {
        bool negative = mantissa < 0;
        std::string digits = (negative ? Integer(-mantissa) : mantissa).str();
        if (scale > 0) {
            if (digits.size() <= scale) {
                digits.insert(0, scale - digits.size() + 1, '0');
            }
            digits.insert(digits.size() - scale, 1, '.');
        }
        return negative ? "-" + digits : digits;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace inventory::domain
