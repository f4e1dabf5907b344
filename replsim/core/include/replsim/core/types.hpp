#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace replsim::core {

/// @brief Calendar interval represented as an integer day count.
///
/// Days wraps an `int64_t` with a private constructor. All construction goes
/// through the @ref days factory so that raw integers never silently turn
/// into intervals.
///
/// Arithmetic between two Days yields Days. Days can be added to a @ref Date.
///
/// @see days, Date
/// @ingroup core_types
class Days {
    int64_t count_;

    explicit constexpr Days(int64_t n) noexcept : count_(n) {}

    friend constexpr Days days(int64_t n) noexcept;

public:
    /// @brief Default constructor: zero-length interval.
    constexpr Days() noexcept : count_(0) {}

    /// @brief Named factory returning a zero-length interval.
    static constexpr Days zero() noexcept { return Days{0}; }

    /// @brief Return the raw day count.
    [[nodiscard]] constexpr int64_t count() const noexcept { return count_; }

    constexpr Days operator+(Days rhs) const noexcept { return Days{count_ + rhs.count_}; }
    constexpr Days operator-(Days rhs) const noexcept { return Days{count_ - rhs.count_}; }
    constexpr Days operator-() const noexcept { return Days{-count_}; }

    constexpr Days& operator+=(Days rhs) noexcept {
        count_ += rhs.count_;
        return *this;
    }

    constexpr Days& operator-=(Days rhs) noexcept {
        count_ -= rhs.count_;
        return *this;
    }

    constexpr auto operator<=>(const Days& rhs) const noexcept = default;
    constexpr bool operator==(const Days& rhs) const noexcept = default;
};

/// @brief Calendar date (day resolution, proleptic Gregorian).
///
/// Stored as a @ref Days offset from 1970-01-01. A Date plus Days yields a
/// Date; the difference of two Dates yields Days. Two Dates cannot be added.
///
/// @see date_from_ymd, format_iso_date, parse_iso_date
/// @ingroup core_types
class Date {
    Days since_epoch_;

    explicit constexpr Date(Days d) noexcept : since_epoch_(d) {}

    friend constexpr Date date_from_days_since_epoch(int64_t n) noexcept;

public:
    /// @brief Default constructor: 1970-01-01.
    ///
    /// Needed for aggregate initialization and container value types.
    constexpr Date() noexcept : since_epoch_(Days::zero()) {}

    /// @brief Named factory returning 1970-01-01.
    static constexpr Date epoch() noexcept { return Date{Days::zero()}; }

    /// @brief Days elapsed since 1970-01-01 (negative before it).
    [[nodiscard]] constexpr Days days_since_epoch() const noexcept { return since_epoch_; }

    constexpr Date operator+(Days d) const noexcept { return Date{since_epoch_ + d}; }
    constexpr Date operator-(Days d) const noexcept { return Date{since_epoch_ - d}; }

    constexpr Date& operator+=(Days d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Date& operator-=(Days d) noexcept {
        since_epoch_ -= d;
        return *this;
    }

    /// @brief Number of days from @p rhs to this date.
    constexpr Days operator-(Date rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const Date& rhs) const noexcept = default;
    constexpr bool operator==(const Date& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions
// ============================================================================

/// @brief Create a day interval.
/// @param n Number of days (may be negative).
[[nodiscard]] constexpr Days days(int64_t n) noexcept {
    return Days{n};
}

/// @brief Create a Date from a day offset relative to 1970-01-01.
[[nodiscard]] constexpr Date date_from_days_since_epoch(int64_t n) noexcept {
    return Date{days(n)};
}

/// @brief Day offset of @p d relative to 1970-01-01.
[[nodiscard]] constexpr int64_t date_to_days_since_epoch(Date d) noexcept {
    return d.days_since_epoch().count();
}

/// @brief Convert a valid civil date to a Date.
///
/// The caller must ensure `ymd.ok()`; use the throwing overload for
/// unchecked input.
[[nodiscard]] constexpr Date date_from_ymd(std::chrono::year_month_day ymd) noexcept {
    return date_from_days_since_epoch(
        static_cast<int64_t>(std::chrono::sys_days{ymd}.time_since_epoch().count()));
}

/// @brief Convert a Date to its civil year/month/day.
[[nodiscard]] constexpr std::chrono::year_month_day date_to_ymd(Date d) noexcept {
    return std::chrono::year_month_day{
        std::chrono::sys_days{std::chrono::days{date_to_days_since_epoch(d)}}};
}

/// @brief Create a Date from numeric year, month and day.
/// @throws InvalidParameterError if the triple is not a valid calendar date.
[[nodiscard]] Date date_from_ymd(int year, unsigned month, unsigned day);

/// @brief Format as ISO 8601 `YYYY-MM-DD`.
[[nodiscard]] std::string format_iso_date(Date d);

/// @brief Parse a strict ISO 8601 `YYYY-MM-DD` string.
/// @return The date, or std::nullopt when @p text is malformed or names a
///         day that does not exist (e.g. 2023-02-29).
[[nodiscard]] std::optional<Date> parse_iso_date(std::string_view text) noexcept;

} // namespace replsim::core
