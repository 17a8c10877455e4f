#include <ddlogs_mcp/core/time_util.hpp>

#include <cstdint>
#include <cstdio>
#include <limits>

namespace ddlogs_mcp {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's
// days_from_civil).
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

CivilDate CivilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {y + (m <= 2 ? 1 : 0), m, d};
}

bool IsLeapYear(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int64_t y, unsigned m) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                         31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeapYear(y)) return 29;
    return kDays[m - 1];
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

// Parse exactly n digits at text[pos]. Returns -1 on failure.
int FixedDigits(std::string_view text, size_t pos, size_t n) {
    if (pos + n > text.size()) return -1;
    int value = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!IsDigit(text[i])) return -1;
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

std::string FormatUtc(TimePoint tp, bool with_millis) {
    using namespace std::chrono;
    const auto since_epoch = tp.time_since_epoch();
    const auto secs = duration_cast<seconds>(since_epoch);
    int64_t total = secs.count();
    int64_t millis = duration_cast<milliseconds>(since_epoch - secs).count();
    // Floor toward negative infinity for instants before the epoch.
    if (millis < 0) {
        millis += 1000;
        total -= 1;
    }
    int64_t days = total / 86400;
    int64_t rem = total % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }
    const auto date = CivilFromDays(days);

    char buf[40];
    if (with_millis) {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<int>(rem / 3600),
                      static_cast<int>((rem % 3600) / 60),
                      static_cast<int>(rem % 60), static_cast<int>(millis));
    } else {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<int>(rem / 3600),
                      static_cast<int>((rem % 3600) / 60),
                      static_cast<int>(rem % 60));
    }
    return buf;
}

constexpr uint64_t kMaxDuration =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

// Consume leading decimal digits. Returns false on overflow.
bool LeadingInt(std::string_view& s, uint64_t& value) {
    size_t i = 0;
    value = 0;
    for (; i < s.size() && IsDigit(s[i]); ++i) {
        if (value > kMaxDuration / 10) return false;
        value = value * 10 + static_cast<uint64_t>(s[i] - '0');
        if (value > kMaxDuration + 1) return false;
    }
    s.remove_prefix(i);
    return true;
}

// Consume fraction digits after '.'. Digits beyond 64-bit precision are
// dropped rather than treated as an error.
void LeadingFraction(std::string_view& s, uint64_t& value, double& scale) {
    size_t i = 0;
    value = 0;
    scale = 1;
    bool overflow = false;
    for (; i < s.size() && IsDigit(s[i]); ++i) {
        if (overflow) continue;
        if (value > kMaxDuration / 10) {
            overflow = true;
            continue;
        }
        const uint64_t next = value * 10 + static_cast<uint64_t>(s[i] - '0');
        if (next > kMaxDuration) {
            overflow = true;
            continue;
        }
        value = next;
        scale *= 10;
    }
    s.remove_prefix(i);
}

uint64_t UnitNanos(std::string_view unit) {
    if (unit == "ns") return 1;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1000;
    if (unit == "ms") return 1000 * 1000;
    if (unit == "s") return 1000ULL * 1000 * 1000;
    if (unit == "m") return 60ULL * 1000 * 1000 * 1000;
    if (unit == "h") return 3600ULL * 1000 * 1000 * 1000;
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseRfc3339
// ---------------------------------------------------------------------------
Result<TimePoint, std::string> ParseRfc3339(std::string_view text) {
    using R = Result<TimePoint, std::string>;
    const auto fail = [&](const std::string& why) {
        return R::Err("cannot parse '" + std::string(text) + "' as RFC3339: " + why);
    };

    // YYYY-MM-DDTHH:MM:SS is 19 characters.
    if (text.size() < 20) return fail("too short");

    const int year = FixedDigits(text, 0, 4);
    const int month = FixedDigits(text, 5, 2);
    const int day = FixedDigits(text, 8, 2);
    const int hour = FixedDigits(text, 11, 2);
    const int minute = FixedDigits(text, 14, 2);
    const int second = FixedDigits(text, 17, 2);
    if (year < 0 || month < 0 || day < 0 || hour < 0 || minute < 0 ||
        second < 0 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return fail("expected YYYY-MM-DDTHH:MM:SS");
    }
    if (month < 1 || month > 12) return fail("month out of range");
    if (day < 1 || static_cast<unsigned>(day) >
                       DaysInMonth(year, static_cast<unsigned>(month))) {
        return fail("day out of range");
    }
    if (hour > 23) return fail("hour out of range");
    if (minute > 59) return fail("minute out of range");
    if (second > 59) return fail("second out of range");

    size_t pos = 19;
    int64_t nanos = 0;
    if (text[pos] == '.') {
        ++pos;
        const size_t start = pos;
        int64_t scale = 100000000;
        while (pos < text.size() && IsDigit(text[pos])) {
            nanos += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) return fail("empty fractional seconds");
    }

    if (pos >= text.size()) return fail("missing time zone offset");

    int64_t offset_seconds = 0;
    if (text[pos] == 'Z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const int sign = text[pos] == '-' ? -1 : 1;
        const int off_h = FixedDigits(text, pos + 1, 2);
        const int off_m = FixedDigits(text, pos + 4, 2);
        if (off_h < 0 || off_m < 0 || pos + 3 >= text.size() ||
            text[pos + 3] != ':') {
            return fail("expected time zone offset as +hh:mm");
        }
        if (off_h > 23 || off_m > 59) return fail("time zone offset out of range");
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
        pos += 6;
    } else {
        return fail("expected 'Z' or a time zone offset");
    }
    if (pos != text.size()) return fail("unexpected trailing text");

    const int64_t days = DaysFromCivil(year, static_cast<unsigned>(month),
                                       static_cast<unsigned>(day));
    const int64_t epoch_seconds =
        days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    using namespace std::chrono;
    const auto max_seconds =
        duration_cast<seconds>(TimePoint::max().time_since_epoch()).count() - 1;
    const auto min_seconds =
        duration_cast<seconds>(TimePoint::min().time_since_epoch()).count() + 1;
    if (epoch_seconds > max_seconds || epoch_seconds < min_seconds) {
        return fail("timestamp out of range");
    }

    const auto since_epoch = seconds(epoch_seconds) + nanoseconds(nanos);
    return R::Ok(TimePoint(duration_cast<TimePoint::duration>(since_epoch)));
}

std::string FormatRfc3339(TimePoint tp) {
    return FormatUtc(tp, false);
}

std::string FormatRfc3339Millis(TimePoint tp) {
    return FormatUtc(tp, true);
}

// ---------------------------------------------------------------------------
// ParseDuration
// ---------------------------------------------------------------------------
Result<std::chrono::nanoseconds, std::string> ParseDuration(std::string_view text) {
    using R = Result<std::chrono::nanoseconds, std::string>;
    const std::string quoted = "'" + std::string(text) + "'";

    std::string_view s = text;
    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s == "0") return R::Ok(std::chrono::nanoseconds(0));
    if (s.empty()) return R::Err("invalid duration " + quoted);

    uint64_t total = 0;
    while (!s.empty()) {
        if (!(s.front() == '.' || IsDigit(s.front()))) {
            return R::Err("invalid duration " + quoted);
        }

        uint64_t whole = 0;
        const size_t before_int = s.size();
        if (!LeadingInt(s, whole)) return R::Err("invalid duration " + quoted);
        const bool has_int = before_int != s.size();

        uint64_t frac = 0;
        double scale = 1;
        bool has_frac = false;
        if (!s.empty() && s.front() == '.') {
            s.remove_prefix(1);
            const size_t before_frac = s.size();
            LeadingFraction(s, frac, scale);
            has_frac = before_frac != s.size();
        }
        if (!has_int && !has_frac) return R::Err("invalid duration " + quoted);

        size_t unit_len = 0;
        while (unit_len < s.size() && s[unit_len] != '.' && !IsDigit(s[unit_len])) {
            ++unit_len;
        }
        if (unit_len == 0) return R::Err("missing unit in duration " + quoted);
        const auto unit_text = s.substr(0, unit_len);
        s.remove_prefix(unit_len);

        const uint64_t unit = UnitNanos(unit_text);
        if (unit == 0) {
            return R::Err("unknown unit '" + std::string(unit_text) +
                          "' in duration " + quoted);
        }

        if (whole > (kMaxDuration + 1) / unit) {
            return R::Err("invalid duration " + quoted);
        }
        whole *= unit;
        if (frac > 0) {
            whole += static_cast<uint64_t>(static_cast<double>(frac) *
                                           (static_cast<double>(unit) / scale));
            if (whole > kMaxDuration + 1) return R::Err("invalid duration " + quoted);
        }
        total += whole;
        if (total > kMaxDuration + 1) return R::Err("invalid duration " + quoted);
    }

    if (total > kMaxDuration) {
        if (!negative) return R::Err("invalid duration " + quoted);
        return R::Ok(std::chrono::nanoseconds(std::numeric_limits<int64_t>::min()));
    }
    const auto value = static_cast<int64_t>(total);
    return R::Ok(std::chrono::nanoseconds(negative ? -value : value));
}

} // namespace ddlogs_mcp
