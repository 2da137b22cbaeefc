#include "ktnsync/core/util/time.hpp"

#include <array>
#include <cctype>
#include <cstdio>

namespace ktnsync {

    namespace {
        // Days since 1970-01-01 for a proleptic Gregorian date.
        std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }

        void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
            z += 719468;
            const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            d = doy - (153 * mp + 2) / 5 + 1;
            m = mp < 10 ? mp + 3 : mp - 9;
            y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
        }

        bool isLeap(std::int64_t y) {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        unsigned daysInMonth(std::int64_t y, unsigned m) {
            static constexpr std::array<unsigned, 12> days{ 31,28,31,30,31,30,31,31,30,31,30,31 };
            return (m == 2 && isLeap(y)) ? 29 : days[m - 1];
        }

        /* Reads exactly n digits at pos; advances pos. */
        bool readDigits(std::string_view s, size_t& pos, size_t n, int& out) {
            if (pos + n > s.size()) return false;
            int v = 0;
            for (size_t i = 0; i < n; ++i) {
                char c = s[pos + i];
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
                v = v * 10 + (c - '0');
            }
            pos += n;
            out = v;
            return true;
        }

        bool expect(std::string_view s, size_t& pos, char c) {
            if (pos >= s.size() || s[pos] != c) return false;
            ++pos;
            return true;
        }
    }

    std::string toIso8601(std::int64_t epochMs) {
        std::int64_t days = epochMs / 86400000;
        std::int64_t rem  = epochMs % 86400000;
        if (rem < 0) { rem += 86400000; --days; }

        std::int64_t y; unsigned m, d;
        civilFromDays(days, y, m, d);

        const int hh = static_cast<int>(rem / 3600000);
        const int mm = static_cast<int>((rem / 60000) % 60);
        const int ss = static_cast<int>((rem / 1000) % 60);
        const int ms = static_cast<int>(rem % 1000);

        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<long long>(y), m, d, hh, mm, ss, ms);
        return buf;
    }

    std::optional<std::int64_t> parseIso8601(std::string_view s) {
        size_t pos = 0;
        int year, month, day;
        if (!readDigits(s, pos, 4, year) || !expect(s, pos, '-') ||
            !readDigits(s, pos, 2, month) || !expect(s, pos, '-') ||
            !readDigits(s, pos, 2, day))
            return std::nullopt;
        if (month < 1 || month > 12) return std::nullopt;
        if (day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) return std::nullopt;

        int hour = 0, minute = 0, second = 0, millis = 0;
        std::int64_t offsetMinutes = 0;

        if (pos < s.size()) {
            if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
            ++pos;
            if (!readDigits(s, pos, 2, hour) || !expect(s, pos, ':') ||
                !readDigits(s, pos, 2, minute))
                return std::nullopt;
            if (pos < s.size() && s[pos] == ':') {
                ++pos;
                if (!readDigits(s, pos, 2, second)) return std::nullopt;
                if (pos < s.size() && s[pos] == '.') {
                    ++pos;
                    size_t start = pos;
                    int scale = 100;
                    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                        millis += (s[pos] - '0') * scale;
                        scale /= 10;
                        ++pos;
                    }
                    if (pos == start) return std::nullopt;
                }
            }
            if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

            if (pos < s.size()) {
                char z = s[pos];
                if (z == 'Z' || z == 'z') {
                    ++pos;
                } else if (z == '+' || z == '-') {
                    ++pos;
                    int oh, om;
                    if (!readDigits(s, pos, 2, oh)) return std::nullopt;
                    if (pos < s.size() && s[pos] == ':') ++pos;
                    if (!readDigits(s, pos, 2, om)) return std::nullopt;
                    if (oh > 23 || om > 59) return std::nullopt;
                    offsetMinutes = (z == '+' ? 1 : -1) * (oh * 60 + om);
                } else {
                    return std::nullopt;
                }
            }
        }
        if (pos != s.size()) return std::nullopt;

        std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        std::int64_t ms = days * 86400000
            + static_cast<std::int64_t>(hour) * 3600000
            + static_cast<std::int64_t>(minute) * 60000
            + static_cast<std::int64_t>(second) * 1000
            + millis
            - offsetMinutes * 60000;
        return ms;
    }

    bool isStrictlyLater(std::string_view candidate, std::string_view reference) {
        auto a = parseIso8601(candidate);
        auto b = parseIso8601(reference);
        return a && b && *a > *b;
    }

    std::string toBase36(std::uint64_t value) {
        static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        if (value == 0) return "0";
        std::string out;
        while (value > 0) {
            out.insert(out.begin(), digits[value % 36]);
            value /= 36;
        }
        return out;
    }
}
