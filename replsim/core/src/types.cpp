#include <replsim/core/types.hpp>
#include <replsim/core/error.hpp>

#include <charconv>
#include <iomanip>
#include <sstream>

namespace replsim::core {

namespace {

bool parse_digits(std::string_view text, int& out) noexcept {
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // anonymous namespace

Date date_from_ymd(int year, unsigned month, unsigned day) {
    std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok()) {
        std::ostringstream oss;
        oss << "invalid calendar date " << year << "-" << month << "-" << day;
        throw InvalidParameterError(oss.str());
    }
    return date_from_ymd(ymd);
}

std::string format_iso_date(Date d) {
    auto ymd = date_to_ymd(d);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

std::optional<Date> parse_iso_date(std::string_view text) noexcept {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_digits(text.substr(0, 4), year) ||
        !parse_digits(text.substr(5, 2), month) ||
        !parse_digits(text.substr(8, 2), day)) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return date_from_ymd(ymd);
}

} // namespace replsim::core
