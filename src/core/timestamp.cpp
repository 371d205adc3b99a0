/*
 * UUIDKIT COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the UuidKit Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file timestamp.cpp
 * @brief Implementation of instant resolution and timestamp adjustment.
 */

#include "uuidkit/core/timestamp.hpp"

#include "uuidkit/infra/string.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace uuidkit::core {

namespace {

constexpr std::int64_t kMicrosPerSecond = 1000000;
constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kInt64Min = std::numeric_limits<std::int64_t>::min();

Instant system_now()
{
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

/**
 * Days since 1970-01-01 for a proleptic Gregorian date.
 * (Howard Hinnant's days_from_civil.)
 */
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool is_leap(std::int64_t y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m)
{
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

/// Minimal forward-only reader over the input text.
class Cursor {
  public:
    explicit Cursor(std::string_view text) : text_(text) {}

    bool done() const { return pos_ >= text_.size(); }
    char peek() const { return done() ? '\0' : text_[pos_]; }

    bool accept(char c)
    {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    /// Reads between `min` and `max` digits into `out`.
    bool digits(std::size_t min, std::size_t max, std::int64_t& out)
    {
        std::size_t count = 0;
        out = 0;
        while (!done() && count < max && std::isdigit(static_cast<unsigned char>(peek()))) {
            out = out * 10 + (text_[pos_++] - '0');
            ++count;
        }
        return count >= min;
    }

    /// Reads a fractional part as microseconds; extra digits are truncated.
    std::int64_t fraction()
    {
        std::int64_t micros = 0;
        std::size_t count = 0;
        while (!done() && std::isdigit(static_cast<unsigned char>(peek()))) {
            if (count < 6) {
                micros = micros * 10 + (peek() - '0');
            }
            ++pos_;
            ++count;
        }
        for (; count < 6; ++count) {
            micros *= 10;
        }
        return micros;
    }

  private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

/// `[@][+-]seconds[.fraction]`
std::optional<Instant> parse_epoch(std::string_view text)
{
    Cursor in(text);
    in.accept('@');

    bool negative = false;
    if (in.accept('-')) {
        negative = true;
    } else {
        in.accept('+');
    }

    std::int64_t seconds = 0;
    bool has_int = in.digits(1, 12, seconds);
    std::int64_t micros = 0;
    if (in.accept('.')) {
        micros = in.fraction();
    } else if (!has_int) {
        return std::nullopt;
    }

    if (!in.done()) {
        return std::nullopt;
    }

    std::int64_t total = seconds * kMicrosPerSecond + micros;
    return Instant(std::chrono::microseconds(negative ? -total : total));
}

/// `YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]][Z|(+|-)HH[:]MM]`
std::optional<Instant> parse_iso8601(std::string_view text)
{
    Cursor in(text);

    std::int64_t year = 0, month = 0, day = 0;
    if (!in.digits(4, 5, year) || !in.accept('-') || !in.digits(2, 2, month) || !in.accept('-') ||
        !in.digits(2, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        day > static_cast<std::int64_t>(days_in_month(year, static_cast<unsigned>(month)))) {
        return std::nullopt;
    }

    std::int64_t hour = 0, minute = 0, second = 0, micros = 0;
    if (in.accept('T') || in.accept('t') || in.accept(' ')) {
        if (!in.digits(2, 2, hour) || !in.accept(':') || !in.digits(2, 2, minute)) {
            return std::nullopt;
        }
        if (in.accept(':')) {
            if (!in.digits(2, 2, second)) {
                return std::nullopt;
            }
            if (in.accept('.') || in.accept(',')) {
                micros = in.fraction();
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
    }

    std::int64_t offset_seconds = 0;
    if (in.accept('Z') || in.accept('z')) {
        // UTC
    } else if (in.peek() == '+' || in.peek() == '-') {
        int sign = 1;
        if (in.accept('-')) {
            sign = -1;
        } else {
            in.accept('+');
        }
        std::int64_t oh = 0, om = 0;
        if (!in.digits(2, 2, oh)) {
            return std::nullopt;
        }
        in.accept(':');
        if (!in.digits(2, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * (oh * 3600 + om * 60);
    }

    if (!in.done()) {
        return std::nullopt;
    }

    std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return Instant(std::chrono::microseconds(seconds * kMicrosPerSecond + micros));
}

/// a + b, clamped to the int64 range.
std::int64_t saturating_add(std::int64_t a, std::int64_t b)
{
    if (b > 0 && a > kInt64Max - b)
        return kInt64Max;
    if (b < 0 && a < kInt64Min - b)
        return kInt64Min;
    return a + b;
}

/// a * b for b > 0, clamped to the int64 range.
std::int64_t saturating_mul(std::int64_t a, std::int64_t b)
{
    if (a > kInt64Max / b)
        return kInt64Max;
    if (a < kInt64Min / b)
        return kInt64Min;
    return a * b;
}

} // namespace

TimestampSource::TimestampSource() : clock_(system_now) {}

TimestampSource::TimestampSource(Clock clock) : clock_(clock ? std::move(clock) : Clock(system_now)) {}

Instant TimestampSource::now() const
{
    return clock_();
}

Instant TimestampSource::resolve(std::string_view text) const
{
    if (auto parsed = parse(text)) {
        return *parsed;
    }
    return now();
}

std::optional<Instant> TimestampSource::parse(std::string_view text)
{
    std::string clean = infra::String::trim(text);
    if (clean.empty() || infra::String::to_lower(clean) == "now") {
        return std::nullopt;
    }

    if (auto epoch = parse_epoch(clean)) {
        return epoch;
    }
    return parse_iso8601(clean);
}

AdjustedTimestamp TimestampSource::adjust(Instant instant, int version)
{
    const std::int64_t micros = instant.time_since_epoch().count();

    std::int64_t ticks = 0;
    std::int64_t limit = 0;

    switch (version) {
    case 1:
    case 2:
    case 6:
        // 100-nanosecond intervals since the Gregorian reform.
        ticks = saturating_mul(saturating_add(micros, kGregorianOffsetSeconds * kMicrosPerSecond), 10);
        limit = kMaxGregorianTicks;
        break;

    case 7:
        ticks = micros / 1000;
        limit = kMaxUnixMillis;
        break;

    default:
        throw std::invalid_argument("No timestamp encoding for UUID version " + std::to_string(version));
    }

    TimestampRange range = TimestampRange::InRange;
    if (ticks < 0) {
        range = TimestampRange::TooEarly;
    } else if (ticks > limit) {
        range = TimestampRange::TooLate;
    }

    return {ticks, range};
}

} // namespace uuidkit::core
