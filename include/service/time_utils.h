/**
 * @file time_utils.h
 * @brief 本地日历时间工具
 * @details 所有函数都按进程本地时区 (TZ) 解释 Unix 时间戳。
 *          时区是进程级的: 同一进程内不能同时按两个时区计算日/月边界,
 *          需要切换时由调用方设置 TZ 并调用 tzset()。
 */

#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <ctime>
#include <cstdint>
#include <functional>
#include <string>

namespace service {

// 可注入的时钟, 默认为系统时间
using NowFn = std::function<std::time_t()>;

std::time_t system_now();

// 本地日期时间 -> Unix 秒; month 为 1-12
std::time_t make_local_time(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

// 当天零点
std::time_t start_of_day(std::time_t t);

// 次日零点
std::time_t start_of_next_day(std::time_t t);

// 当月 1 日零点
std::time_t start_of_month(std::time_t t);

// 周六或周日
bool is_weekend(std::time_t t);

// [start, end) 之间 (按日历日逐日推进) 的工作日数
int count_weekdays(std::time_t start, std::time_t end);

// "YYYY-MM-DD" -> 当天零点; 格式错误返回 false
bool parse_date(const std::string& text, std::time_t& out);

// "YYYY-MM-DD HH:MM:SS"
std::string format_local(std::time_t t);

// 距下一个本地 hour:minute 的秒数 (恰好在该时刻时返回一整天)
int64_t seconds_until_next(std::time_t now, int hour, int minute);

} // namespace service

#endif // TIME_UTILS_H
