#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

namespace Driftwatch {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief High-resolution timer for phase and run durations.
 */
class Timer {
public:
    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<SteadyClock>;

    Timer() : start_(SteadyClock::now()) {}

    void reset() {
        start_ = SteadyClock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(SteadyClock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Format a timestamp in UTC with a strftime pattern.
 */
inline std::string format_utc(Timestamp tp, const char* pattern) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &tm);
    return buf;
}

/**
 * @brief ISO-8601 UTC with microseconds: 2026-10-19T08:00:00.000000Z
 */
inline std::string to_iso8601(Timestamp tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    std::ostringstream ss;
    ss << format_utc(tp, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(6) << std::setfill('0') << micros << 'Z';
    return ss.str();
}

/**
 * @brief PostgreSQL TIMESTAMP literal (UTC, no zone): 2026-10-19 08:00:00.000000
 */
inline std::string to_sql_timestamp(Timestamp tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    std::ostringstream ss;
    ss << format_utc(tp, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

/**
 * @brief Parse a PostgreSQL TIMESTAMP text value, interpreted as UTC.
 *
 * Accepts "YYYY-MM-DD HH:MM:SS" with an optional fractional part and
 * a 'T' separator.
 * @throws std::invalid_argument on malformed input
 */
inline Timestamp parse_sql_timestamp(const std::string& text) {
    std::tm tm{};
    std::string normalized = text;
    if (normalized.size() > 10 && normalized[10] == 'T') normalized[10] = ' ';

    std::istringstream ss(normalized);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }

    long long micros = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) digits.push_back(static_cast<char>(ss.get()));
        digits.resize(6, '0');
        micros = std::stoll(digits);
    }

    std::time_t seconds = timegm(&tm);
    return Clock::from_time_t(seconds) + std::chrono::microseconds(micros);
}

inline Timestamp days_before(Timestamp tp, int days) {
    return tp - std::chrono::hours(24 * days);
}

} // namespace Driftwatch
