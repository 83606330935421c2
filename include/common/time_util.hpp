/*
 * File: include/common/time_util.hpp
 * Project: Tool Sync
 * Purpose: Timestamp formatting and parsing
 * Notes:
 *  - Wire timestamps are RFC3339 UTC with milliseconds
 *  - Lexical order of formatted timestamps matches time order
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

using SysTime = std::chrono::system_clock::time_point;

// Injectable wall clock; engine tests pin it.
using NowFn = std::function<SysTime()>;

inline SysTime system_now() { return std::chrono::system_clock::now(); }

// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
inline std::string format_iso8601_ms(SysTime t)
{
    using namespace std::chrono;
    auto tp = time_point_cast<milliseconds>(t);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0)
        ms += milliseconds(1000);
    std::time_t tt = system_clock::to_time_t(tp);
    if (tp < system_clock::from_time_t(tt))
        tt -= 1;
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::string iso8601_now_ms() { return format_iso8601_ms(system_now()); }

// Accepts YYYY-MM-DDTHH:MM:SS[.fff...][Z|+HH:MM|-HH:MM]. A date alone is midnight UTC.
inline std::optional<SysTime> parse_iso8601(const std::string &s)
{
    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &Y, &M, &D, &consumed) != 3)
        return std::nullopt;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < s.size())
    {
        if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')
            return std::nullopt;
        int n = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d:%2d%n", &h, &m, &sec, &n) != 3)
            return std::nullopt;
        pos += 1 + static_cast<std::size_t>(n);
    }
    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60)
        return std::nullopt;

    long millis = 0;
    if (pos < s.size() && s[pos] == '.')
    {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
        {
            if (digits < 3)
                millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (int d = digits; d < 3; ++d)
            millis *= 10;
    }

    long offset_s = 0;
    if (pos < s.size())
    {
        char c = s[pos];
        if (c == 'Z' || c == 'z')
        {
            ++pos;
        }
        else if (c == '+' || c == '-')
        {
            int oh = 0, om = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2)
                return std::nullopt;
            offset_s = (oh * 3600L + om * 60L) * (c == '+' ? 1 : -1);
            pos += 6;
        }
        else
        {
            return std::nullopt;
        }
    }
    if (pos != s.size())
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = sec;
    std::time_t tt = timegm(&tm);
    return std::chrono::system_clock::from_time_t(tt) - std::chrono::seconds(offset_s) +
           std::chrono::milliseconds(millis);
}

inline long long epoch_ms(SysTime t)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}
