#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <optional>
#include <ctime>
#include <cctype>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Временная метка (UTC, точность - микросекунды)
 *
 * Микросекунды совпадают с точностью TIMESTAMPTZ в PostgreSQL, поэтому
 * ключ (from, to, timestamp) курса одинаково сравнивается в памяти и в БД.
 */
struct Timestamp {
    using Clock = std::chrono::system_clock;
    using Micros = std::chrono::microseconds;

    Clock::time_point value;

    Timestamp() : value(truncate(Clock::now())) {}

    explicit Timestamp(Clock::time_point tp) : value(truncate(tp)) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(Clock::now());
    }

    /**
     * @brief Разобрать ISO 8601 строку
     *
     * Поддерживаются "2025-12-16", "2025-12-16T10:30:00",
     * "2025-12-16T10:30:00.123456Z" (пробел вместо T тоже допустим).
     * Время всегда трактуется как UTC.
     */
    static std::optional<Timestamp> parse(const std::string& isoString) {
        std::string text = isoString;
        if (text.size() > 10 && text[10] == ' ') {
            text[10] = 'T';
        }

        std::tm tm = {};
        std::istringstream ss(text);
        int64_t micros = 0;

        if (text.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                return std::nullopt;
            }
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
            if (ss.fail()) {
                return std::nullopt;
            }

            std::string rest;
            std::getline(ss, rest);
            size_t pos = 0;
            if (pos < rest.size() && rest[pos] == '.') {
                ++pos;
                int digits = 0;
                while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
                    if (digits < 6) {
                        micros = micros * 10 + (rest[pos] - '0');
                        ++digits;
                    }
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (; digits < 6; ++digits) {
                    micros *= 10;
                }
            }
            if (pos < rest.size() && rest[pos] == 'Z') {
                ++pos;
            }
            if (pos != rest.size()) {
                return std::nullopt;
            }
        }

        auto tp = Clock::from_time_t(timegm(&tm)) + Micros(micros);
        return Timestamp(tp);
    }

    /**
     * @brief Преобразовать в ISO 8601 строку ("2025-12-16T10:30:00.250000Z")
     *
     * Дробная часть выводится только если она ненулевая.
     */
    std::string toString() const {
        int64_t micros = toUnixMicros();
        int64_t seconds = micros / 1000000;
        int64_t fraction = micros % 1000000;
        if (fraction < 0) {
            fraction += 1000000;
            seconds -= 1;
        }

        std::time_t time_t_val = static_cast<std::time_t>(seconds);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (fraction != 0) {
            ss << "." << std::setw(6) << std::setfill('0') << fraction;
        }
        ss << "Z";
        return ss.str();
    }

    int64_t toUnixMicros() const {
        return std::chrono::duration_cast<Micros>(value.time_since_epoch()).count();
    }

    static Timestamp fromUnixMicros(int64_t micros) {
        return Timestamp(Clock::time_point(Micros(micros)));
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Создать из Unix timestamp
     */
    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(Clock::time_point(std::chrono::seconds(seconds)));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addMinutes(int64_t minutes) const {
        return Timestamp(value + std::chrono::minutes(minutes));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static Clock::time_point truncate(Clock::time_point tp) {
        return std::chrono::time_point_cast<Micros>(tp);
    }
};

} // namespace ledger::domain
