#include "timestamp.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace ledgerbt {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

// Fixed-width unsigned field; false if any char is not a digit.
bool readField(const std::string& s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        char c = s[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

bool isLeapYear(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : days[m - 1];
}

bool validDate(int y, int m, int d) {
    return m >= 1 && m <= 12 && d >= 1 && d <= daysInMonth(y, m);
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153u * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2u) / 5u + static_cast<unsigned>(d) - 1u;
    const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460u + doe / 36524u - doe / 146096u) / 365u;
    const unsigned doy = doe - (365u * yoe + yoe / 4u - yoe / 100u);
    const unsigned mp = (5u * doy + 2u) / 153u;
    d = static_cast<int>(doy - (153u * mp + 2u) / 5u + 1u);
    m = static_cast<int>(mp < 10u ? mp + 3u : mp - 9u);
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

} // namespace

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    std::string s;
    auto start = text.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return std::nullopt;
    auto end = text.find_last_not_of(" \t\r\n\"");
    s = text.substr(start, end - start + 1);

    // Compact YYYYMMDD takes precedence over 8-digit epoch seconds
    if (s.size() == 8 && allDigits(s)) {
        int y = 0, m = 0, d = 0;
        if (readField(s, 0, 4, y) && readField(s, 4, 2, m) && readField(s, 6, 2, d)
            && validDate(y, m, d))
            return daysFromCivil(y, m, d) * SECONDS_PER_DAY;
    }

    if (allDigits(s)) {
        char* endp = nullptr;
        long long v = std::strtoll(s.c_str(), &endp, 10);
        if (endp == nullptr || *endp != '\0') return std::nullopt;
        return static_cast<Timestamp>(v);
    }

    for (auto& c : s) if (c == '_') c = ':';

    // Date YYYY-MM-DD
    int year = 0, month = 0, day = 0;
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    if (!readField(s, 0, 4, year) || !readField(s, 5, 2, month) || !readField(s, 8, 2, day))
        return std::nullopt;
    if (!validDate(year, month, day)) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    if (s.size() > 10) {
        if (s[10] != 'T' && s[10] != ' ') return std::nullopt;
        std::string timePart = s.substr(11);
        if (!timePart.empty() && timePart.back() == 'Z') timePart.pop_back();
        if (timePart.size() < 5 || timePart[2] != ':') return std::nullopt;
        if (!readField(timePart, 0, 2, hour) || !readField(timePart, 3, 2, minute))
            return std::nullopt;
        if (timePart.size() > 5) {
            if (timePart[5] != ':' || !readField(timePart, 6, 2, second)) return std::nullopt;
            // fractional seconds are dropped
            if (timePart.size() > 8 && timePart[8] != '.') return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    return daysFromCivil(year, month, day) * SECONDS_PER_DAY
        + hour * 3600 + minute * 60 + second;
}

std::string formatTimestamp(Timestamp ts) {
    std::int64_t days = ts / SECONDS_PER_DAY;
    std::int64_t rem = ts % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
        --days;
    }
    int y, m, d;
    civilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", y, m, d,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60));
    return std::string(buf);
}

std::string formatDuration(std::int64_t seconds) {
    bool negative = seconds < 0;
    if (negative) seconds = -seconds;
    std::int64_t days = seconds / SECONDS_PER_DAY;
    std::int64_t rem = seconds % SECONDS_PER_DAY;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%lldd %02d:%02d:%02d", negative ? "-" : "",
                  static_cast<long long>(days), static_cast<int>(rem / 3600),
                  static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return std::string(buf);
}

} // namespace ledgerbt
