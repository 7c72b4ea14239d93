#include "util/time_format.hpp"

#include <cstdio>
#include <ctime>

namespace mangashelf {

std::string format_rfc3339(Timestamp t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm_utc;
    ::gmtime_r(&tt, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

static bool read_digits(const std::string& s, size_t& pos, int count, int& value) {
    if (pos + count > s.size()) return false;
    value = 0;
    for (int i = 0; i < count; i++) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    pos++;
    return true;
}

bool parse_rfc3339(const std::string& text, Timestamp& out) {
    size_t pos = 0;
    int year, month, day, hour, minute, second;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return false;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return false;
    }
    pos++;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    // Fractional seconds are dropped.
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        size_t start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') pos++;
        if (pos == start) return false;
    }

    long offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        pos++;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = (text[pos] == '-') ? -1 : 1;
        pos++;
        int oh, om;
        if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, om)) {
            return false;
        }
        offset_seconds = sign * (oh * 3600L + om * 60L);
    } else {
        return false;
    }
    if (pos != text.size()) return false;

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;
    std::time_t tt = ::timegm(&tm_utc);

    out = std::chrono::system_clock::from_time_t(tt - offset_seconds);
    return true;
}

Timestamp now_seconds() {
    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
}

} // namespace mangashelf
