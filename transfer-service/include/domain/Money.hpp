// transfer-service/include/domain/Money.hpp
#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>
#include <cctype>

namespace transfer::domain {

/**
 * @brief Денежная сумма в центах
 *
 * Хранится как int64, чтобы не терять точность на арифметике.
 * Текстовое представление совпадает с NUMERIC(15,2): "1500000.00".
 */
class Money {
public:
    Money() = default;

    static Money fromCents(int64_t cents) {
        return Money(cents);
    }

    /**
     * @brief Разбор десятичной строки: "5000", "5000.5", "-12.34"
     * @throws std::invalid_argument при неверном формате или более чем двух знаках после точки
     */
    static Money parse(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Amount is empty");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t units = 0;
        size_t intDigits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (++intDigits > 13) {
                throw std::invalid_argument("Amount is too large: " + text);
            }
            units = units * 10 + (text[pos] - '0');
            ++pos;
        }

        int64_t fraction = 0;
        size_t fracDigits = 0;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                // "100.50" и "100.500" равны, лишние нули допустимы
                if (fracDigits >= 2) {
                    if (text[pos] != '0') {
                        throw std::invalid_argument("Amount has more than two decimal places: " + text);
                    }
                } else {
                    fraction = fraction * 10 + (text[pos] - '0');
                }
                ++fracDigits;
                ++pos;
            }
            if (fracDigits == 0) {
                throw std::invalid_argument("Invalid amount: " + text);
            }
        }

        if (pos != text.size() || (intDigits == 0 && fracDigits == 0)) {
            throw std::invalid_argument("Invalid amount: " + text);
        }

        if (fracDigits == 1) {
            fraction *= 10;
        }

        int64_t cents = units * 100 + fraction;
        return Money(negative ? -cents : cents);
    }

    int64_t cents() const { return cents_; }

    bool isPositive() const { return cents_ > 0; }

    /**
     * @brief "1234.50", "-0.05"
     */
    std::string toString() const {
        uint64_t abs = cents_ < 0
            ? static_cast<uint64_t>(-(cents_ + 1)) + 1
            : static_cast<uint64_t>(cents_);
        std::string fraction = std::to_string(abs % 100);
        if (fraction.size() < 2) {
            fraction = "0" + fraction;
        }
        return (cents_ < 0 ? "-" : "") + std::to_string(abs / 100) + "." + fraction;
    }

    Money operator+(const Money& other) const { return Money(cents_ + other.cents_); }
    Money operator-(const Money& other) const { return Money(cents_ - other.cents_); }

    bool operator==(const Money& other) const { return cents_ == other.cents_; }
    bool operator!=(const Money& other) const { return cents_ != other.cents_; }
    bool operator<(const Money& other) const { return cents_ < other.cents_; }
    bool operator>(const Money& other) const { return cents_ > other.cents_; }
    bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
    bool operator>=(const Money& other) const { return cents_ >= other.cents_; }

private:
    explicit Money(int64_t cents) : cents_(cents) {}

    int64_t cents_ = 0;
};

/**
 * @brief Переводы строго больше этой суммы требуют одобрения
 */
inline const Money APPROVAL_THRESHOLD = Money::fromCents(100'000'000);

} // namespace transfer::domain
