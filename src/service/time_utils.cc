/**
 * @file time_utils.cc
 * @brief 本地日历时间工具实现
 * @details 日期推进一律通过 tm_mday + 1 再 mktime 归一化, 不直接加 86400 秒,
 *          保证夏令时切换日 (23 或 25 小时) 也只计一次。
 */

#include "service/time_utils.h"
#include <cstdio>

namespace service {

namespace {

std::tm to_local(std::time_t t) {
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return tm_buf;
}

std::time_t from_local(std::tm tm_buf) {
    tm_buf.tm_isdst = -1; // 由 mktime 判断夏令时
    return std::mktime(&tm_buf);
}

} // namespace

std::time_t system_now() {
    return std::time(nullptr);
}

std::time_t make_local_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    return from_local(tm_buf);
}

std::time_t start_of_day(std::time_t t) {
    std::tm tm_buf = to_local(t);
    tm_buf.tm_hour = 0;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    return from_local(tm_buf);
}

std::time_t start_of_next_day(std::time_t t) {
    std::tm tm_buf = to_local(t);
    tm_buf.tm_mday += 1;
    tm_buf.tm_hour = 0;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    return from_local(tm_buf);
}

std::time_t start_of_month(std::time_t t) {
    std::tm tm_buf = to_local(t);
    tm_buf.tm_mday = 1;
    tm_buf.tm_hour = 0;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    return from_local(tm_buf);
}

bool is_weekend(std::time_t t) {
    std::tm tm_buf = to_local(t);
    return tm_buf.tm_wday == 0 || tm_buf.tm_wday == 6;
}

int count_weekdays(std::time_t start, std::time_t end) {
    int count = 0;
    std::time_t day = start_of_day(start);
    while (day < end) {
        if (!is_weekend(day)) {
            ++count;
        }
        day = start_of_next_day(day);
    }
    return count;
}

bool parse_date(const std::string& text, std::time_t& out) {
    int year = 0, month = 0, day = 0;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) != 3) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }

    std::time_t t = make_local_time(year, month, day);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    // 拒绝 2月30日 这类被 mktime 归一化到下个月的日期
    std::tm check = to_local(t);
    if (check.tm_mday != day || check.tm_mon != month - 1) {
        return false;
    }
    out = t;
    return true;
}

std::string format_local(std::time_t t) {
    std::tm tm_buf = to_local(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

int64_t seconds_until_next(std::time_t now, int hour, int minute) {
    std::tm tm_buf = to_local(now);
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = 0;
    std::time_t target = from_local(tm_buf);
    if (target <= now) {
        tm_buf = to_local(now);
        tm_buf.tm_mday += 1;
        tm_buf.tm_hour = hour;
        tm_buf.tm_min = minute;
        tm_buf.tm_sec = 0;
        target = from_local(tm_buf);
    }
    return static_cast<int64_t>(target - now);
}

} // namespace service
