#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace ledger::domain {

/**
 * @brief Временная метка (UTC, точность - микросекунды)
 *
 * Микросекунды совпадают с точностью TIMESTAMPTZ в PostgreSQL, поэтому
 * значение переживает round-trip через БД без потерь.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))));
    }

    static Timestamp fromSeconds(int64_t seconds) {
        return fromMicros(seconds * 1000000);
    }

    int64_t toMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(6) << (toMicros() % 1000000 + 1000000) % 1000000;
        ss << 'Z';
        return ss.str();
    }

    Timestamp operator+(std::chrono::microseconds delta) const {
        return fromMicros(toMicros() + delta.count());
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
};

} // namespace ledger::domain
