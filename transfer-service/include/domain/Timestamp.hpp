#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>
#include <stdexcept>
#include <cctype>

namespace transfer::domain {

/**
 * @brief Временная метка (UTC, точность до миллисекунд)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(nowMillis()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(nowMillis());
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Разбор ISO 8601: "2024-01-15", "2024-01-15T10:30:00", "2024-01-15T10:30:00.250Z"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        if (str.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        int64_t millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                if (digits < 3) {
                    millis = millis * 10 + (c - '0');
                }
                ++digits;
            }
            for (; digits < 3; ++digits) {
                millis *= 10;
            }
        }
        if (ss.peek() == 'Z') {
            ss.get();
        }
        if (ss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromMillis(seconds * 1000 + millis);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto millis = toMillis() % 1000;
        if (millis < 0) {
            millis += 1000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }

private:
    // TIMESTAMPTZ хранит микросекунды, наружу отдаём миллисекунды
    static std::chrono::system_clock::time_point nowMillis() {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }
};

} // namespace transfer::domain
