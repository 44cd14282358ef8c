// -----------------------------------------------------------------------------
// timestamp.cpp - Implementation of the iptrack time helpers
//
// API & format descriptions:
//   see include/iptrack/timestamp.hpp
//
// Usage tests:
//   see tests/test_timestamp.cpp
//
// All parsing here is hand-rolled: fixed-width digit scanning with explicit
// range checks. No locale, no std::get_time, no exceptions.
// -----------------------------------------------------------------------------
#include "iptrack/timestamp.hpp"

#include <cstdint>
#include <cstdio>    // snprintf for the "%.0f" rounding used by format_time_ago
#include <ctime>     // gmtime_r, strftime

namespace iptrack {

using namespace std::chrono;

// ---------- civil calendar helpers ----------

// days_from_civil() - days since 1970-01-01 for a proleptic Gregorian date.
// Valid for any year representable in int64; month 1..12, day 1..31.
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

// read exactly `width` decimal digits starting at s[pos]; advances pos
static bool read_digits(const std::string& s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < width; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += width;
    out = v;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

// Optional ".ddd" suffix. Digits beyond nanosecond precision are accepted but dropped.
static bool read_fraction(const std::string& s, size_t& pos, int64_t& nanos) {
    nanos = 0;
    if (pos >= s.size() || s[pos] != '.') return true;
    ++pos;
    size_t digits = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
        if (digits < 9) nanos = nanos * 10 + (s[pos] - '0');
        ++digits;
        ++pos;
    }
    if (digits == 0) return false;              // "." with nothing after it
    for (size_t i = digits; i < 9; ++i) nanos *= 10;
    return true;
}

struct CivilTime {
    int year, month, day, hour, minute, second;
    int64_t nanos;
};

// Shared "YYYY-MM-DD?HH:MM:SS[.fff]" scanner; `sep` is ' ' or 'T'.
static bool read_civil(const std::string& s, size_t& pos, char sep, CivilTime& t) {
    if (!read_digits(s, pos, 4, t.year))  return false;
    if (!expect(s, pos, '-'))             return false;
    if (!read_digits(s, pos, 2, t.month)) return false;
    if (!expect(s, pos, '-'))             return false;
    if (!read_digits(s, pos, 2, t.day))   return false;
    if (!expect(s, pos, sep))             return false;
    if (!read_digits(s, pos, 2, t.hour))  return false;
    if (!expect(s, pos, ':'))             return false;
    if (!read_digits(s, pos, 2, t.minute))return false;
    if (!expect(s, pos, ':'))             return false;
    if (!read_digits(s, pos, 2, t.second))return false;
    if (!read_fraction(s, pos, t.nanos))  return false;

    if (t.month < 1 || t.month > 12)                      return false;
    if (t.day < 1 || t.day > days_in_month(t.year, t.month)) return false;
    if (t.hour > 23 || t.minute > 59 || t.second > 59)    return false;
    return true;
}

// Fails for instants the clock's duration cannot hold (about 1677..2262 with
// nanosecond ticks); the seconds value is checked before any tick conversion.
static std::optional<Timestamp> to_timestamp(const CivilTime& t, int64_t offset_seconds) {
    const int64_t days = days_from_civil(t.year, static_cast<unsigned>(t.month),
                                         static_cast<unsigned>(t.day));
    const int64_t secs = days * 86400 + t.hour * 3600 + t.minute * 60 + t.second
                         - offset_seconds;

    const int64_t max_secs = duration_cast<seconds>(Timestamp::duration::max()).count();
    const int64_t min_secs = duration_cast<seconds>(Timestamp::duration::min()).count();
    if (secs >= max_secs || secs < min_secs) return std::nullopt;

    return Timestamp(duration_cast<Timestamp::duration>(seconds(secs)) +
                     duration_cast<Timestamp::duration>(nanoseconds(t.nanos)));
}

// ---------- public ----------

std::optional<Timestamp> parse_report_timestamp(const std::string& text) {
    size_t pos = 0;
    CivilTime t{};
    if (!read_civil(text, pos, ' ', t)) return std::nullopt;
    if (pos != text.size())             return std::nullopt;   // trailing junk
    return to_timestamp(t, 0);
}

std::string format_rfc3339(Timestamp ts) {
    const auto whole = floor<seconds>(ts);
    const int64_t frac_ns = duration_cast<nanoseconds>(ts - whole).count();

    const std::time_t tt = static_cast<std::time_t>(whole.time_since_epoch().count());
    std::tm utc{};
    gmtime_r(&tt, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    std::string out(buf);

    if (frac_ns > 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%09lld", static_cast<long long>(frac_ns));
        std::string f(frac);
        while (f.back() == '0') f.pop_back();           // ".500000000" -> ".5"
        out += f;
    }
    out += 'Z';
    return out;
}

std::optional<Timestamp> parse_rfc3339(const std::string& text) {
    size_t pos = 0;
    CivilTime t{};
    if (!read_civil(text, pos, 'T', t)) return std::nullopt;

    int64_t offset = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int oh = 0, om = 0;
        if (!read_digits(text, pos, 2, oh)) return std::nullopt;
        if (!expect(text, pos, ':'))        return std::nullopt;
        if (!read_digits(text, pos, 2, om)) return std::nullopt;
        if (oh > 23 || om > 59)             return std::nullopt;
        offset = sign * (oh * 3600 + om * 60);
    } else {
        return std::nullopt;                              // zone designator is mandatory
    }
    if (pos != text.size()) return std::nullopt;
    return to_timestamp(t, offset);
}

std::string format_time_ago(Timestamp then, Timestamp now) {
    const double secs   = duration<double>(now - then).count();
    const double mins   = secs / 60.0;
    const double hours  = mins / 60.0;
    const double days   = hours / 24.0;
    const double months = days / 30.0;
    const double years  = days / 365.0;

    char buf[64];
    if (years >= 1)        std::snprintf(buf, sizeof(buf), "%.0f years ago", years);
    else if (months >= 1)  std::snprintf(buf, sizeof(buf), "%.0f months ago", months);
    else if (days >= 1)    std::snprintf(buf, sizeof(buf), "%.0f days ago", days);
    else if (hours >= 1)   std::snprintf(buf, sizeof(buf), "%.0f hours ago", hours);
    else if (mins >= 1)    std::snprintf(buf, sizeof(buf), "%.0f minutes ago", mins);
    else if (secs >= 10)   std::snprintf(buf, sizeof(buf), "%.0f seconds ago", secs);
    else                   return "just now";
    return buf;
}

} // namespace iptrack
