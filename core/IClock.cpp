#include "IClock.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sailtrack {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : kDays[month - 1];
}

bool readDigits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

std::string formatIso8601(int64_t epochMillis) {
    int64_t seconds = epochMillis / 1000;
    int64_t ms = epochMillis % 1000;
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }
    auto time_t = static_cast<std::time_t>(seconds);

    std::stringstream ss;

    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif

    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::optional<int64_t> parseIso8601(const std::string& raw) {
    std::size_t begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::size_t end = raw.find_last_not_of(" \t\r\n");
    const std::string text = raw.substr(begin, end - begin + 1);

    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (!expect(text, pos, 'T') && !expect(text, pos, ' ')) {
        return std::nullopt;
    }
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int64_t millis = 0;
    if (expect(text, pos, '.')) {
        int64_t scale = 100;
        bool any = false;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
            any = true;
        }
        if (!any) {
            return std::nullopt;
        }
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int offHours = 0, offMinutes = 0;
            if (!readDigits(text, pos, 2, offHours)) {
                return std::nullopt;
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!readDigits(text, pos, 2, offMinutes) || offHours > 23 || offMinutes > 59) {
                return std::nullopt;
            }
            offsetSeconds = (offHours * 3600 + offMinutes * 60) * (zone == '+' ? 1 : -1);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
    return seconds * 1000 + millis;
}

} // namespace sailtrack
