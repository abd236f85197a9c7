#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Денежная сумма с фиксированной точкой
 *
 * Хранит значение в минорных единицах (копейки, центы) - две цифры после
 * запятой, как NUMERIC(18,2) в БД. Знаковая: используется и для балансов,
 * и для изменений (дельт) баланса.
 *
 * Допустимый диапазон: |minor| <= kMaxMinor (ровно то, что вмещает
 * NUMERIC(18,2)). Построение вне диапазона - std::out_of_range,
 * арифметика с результатом вне диапазона - std::overflow_error.
 */
class Money {
public:
    static constexpr int64_t kMinorPerUnit = 100;
    static constexpr int64_t kMaxMinor = 999999999999999999LL;

    Money() = default;

    /**
     * @throws std::out_of_range если |minor| > kMaxMinor
     */
    static Money fromMinor(int64_t minor) {
        if (minor > kMaxMinor || minor < -kMaxMinor) {
            throw std::out_of_range("amount out of range: " + std::to_string(minor) + " minor units");
        }
        Money m;
        m.minor_ = minor;
        return m;
    }

    static Money fromUnits(int64_t units) {
        if (units > kMaxMinor / kMinorPerUnit || units < -(kMaxMinor / kMinorPerUnit)) {
            throw std::out_of_range("amount out of range: " + std::to_string(units) + " units");
        }
        return fromMinor(units * kMinorPerUnit);
    }

    static Money max() { return fromMinor(kMaxMinor); }
    static Money zero() { return Money(); }

    /**
     * @brief Разобрать десятичную строку: "100", "-12.5", "0.01"
     *
     * Больше двух знаков после точки - ошибка (не округляем молча).
     * @throws std::invalid_argument при некорректном формате
     * @throws std::out_of_range если значение не помещается в диапазон
     */
    static Money fromString(const std::string& str) {
        if (str.empty()) {
            throw std::invalid_argument("empty amount");
        }

        std::size_t pos = 0;
        bool negative = false;
        if (str[pos] == '-' || str[pos] == '+') {
            negative = (str[pos] == '-');
            ++pos;
        }

        int64_t units = 0;
        std::size_t digits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (units > kMaxMinor / kMinorPerUnit) {
                throw std::out_of_range("amount out of range: " + str);
            }
            units = units * 10 + (str[pos] - '0');
            ++pos;
            ++digits;
        }

        int64_t fraction = 0;
        std::size_t fractionDigits = 0;
        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                if (fractionDigits == 2) {
                    throw std::invalid_argument("amount has more than two decimal places: " + str);
                }
                fraction = fraction * 10 + (str[pos] - '0');
                ++pos;
                ++fractionDigits;
            }
        }

        if (pos != str.size() || (digits == 0 && fractionDigits == 0)) {
            throw std::invalid_argument("malformed amount: " + str);
        }
        if (fractionDigits == 1) {
            fraction *= 10;
        }

        if (units > kMaxMinor / kMinorPerUnit) {
            throw std::out_of_range("amount out of range: " + str);
        }
        int64_t minor = units * kMinorPerUnit + fraction;
        return fromMinor(negative ? -minor : minor);
    }

    int64_t minor() const { return minor_; }

    /**
     * @brief Десятичная строка с двумя знаками: "-12.50"
     */
    std::string toString() const {
        int64_t abs = minor_ < 0 ? -minor_ : minor_;
        std::string fraction = std::to_string(abs % kMinorPerUnit);
        if (fraction.size() < 2) {
            fraction.insert(0, "0");
        }
        return (minor_ < 0 ? "-" : "") + std::to_string(abs / kMinorPerUnit) + "." + fraction;
    }

    bool isZero() const { return minor_ == 0; }
    bool isPositive() const { return minor_ > 0; }
    bool isNegative() const { return minor_ < 0; }

    // Оба операнда в диапазоне, поэтому сумма и разность помещаются в int64_t;
    // выход за kMaxMinor проверяется отдельно
    Money operator+(const Money& other) const { return checked(minor_ + other.minor_); }
    Money operator-(const Money& other) const { return checked(minor_ - other.minor_); }
    Money operator-() const { return fromMinor(-minor_); }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    bool operator==(const Money& other) const { return minor_ == other.minor_; }
    bool operator!=(const Money& other) const { return minor_ != other.minor_; }
    bool operator<(const Money& other) const { return minor_ < other.minor_; }
    bool operator>(const Money& other) const { return minor_ > other.minor_; }
    bool operator<=(const Money& other) const { return minor_ <= other.minor_; }
    bool operator>=(const Money& other) const { return minor_ >= other.minor_; }

private:
    static Money checked(int64_t minor) {
        if (minor > kMaxMinor || minor < -kMaxMinor) {
            throw std::overflow_error("amount overflow: result exceeds " + fromMinor(kMaxMinor).toString());
        }
        return fromMinor(minor);
    }

    int64_t minor_ = 0;
};

} // namespace ledger::domain
