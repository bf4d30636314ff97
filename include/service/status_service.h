/**
 * @file status_service.h
 * @brief 用户状态快照及其缓存
 */

#ifndef STATUS_SERVICE_H
#define STATUS_SERVICE_H

#include "database/database_types.h"
#include "database/db_status.h"
#include "service/attendance_service.h"
#include "service/balance_calculator.h"
#include "service/time_utils.h"
#include <functional>
#include <map>
#include <mutex>

namespace service {

struct UserStatus {
    int64_t uid = -1;
    db::ClockState state = db::ClockState::Out;
    std::time_t since = 0;
    int64_t day_delta = 0;      // 今日差额
    int64_t month_delta = 0;    // 本月截至今日差额
};

class StatusService {
public:
    explicit StatusService(NowFn now = system_now);

    // 读取状态行并现算今日/本月差额
    db::Status get_status(int64_t uid, UserStatus& out);

private:
    NowFn now_;
    BalanceCalculator balance_;
};

// 单调时钟 (毫秒), 可注入
using MonotonicMsFn = std::function<int64_t()>;

int64_t steady_now_ms();

/**
 * @brief 状态快照缓存
 * 每个用户缓存一份 UserStatus 及其过期时间; 过期后 get() 不再返回,
 * 需调用 refresh() 重新计算。经由本类签到/签退会使该用户的缓存立即失效。
 */
class StatusCache {
public:
    StatusCache(StatusService& status_service, AttendanceService& attendance,
                int64_t ttl_ms, MonotonicMsFn clock = steady_now_ms);

    // 未缓存或已过期返回 false
    bool get(int64_t uid, UserStatus& out);

    // 重新计算并缓存; 计算期间若该用户被 invalidate, 只返回结果不缓存
    db::Status refresh(int64_t uid, UserStatus& out);

    // 优先返回缓存, 否则 refresh
    db::Status get_or_refresh(int64_t uid, UserStatus& out);

    void invalidate(int64_t uid);

    db::Status clock_in(int64_t uid);
    db::Status clock_out(int64_t uid);

private:
    struct CachedStatus {
        UserStatus status;
        int64_t expires_at_ms = 0;
    };

    StatusService& status_service_;
    AttendanceService& attendance_;
    int64_t ttl_ms_;
    MonotonicMsFn clock_;

    std::map<int64_t, CachedStatus> cache_;
    std::map<int64_t, uint64_t> generations_;
    std::mutex mutex_;
};

} // namespace service

#endif // STATUS_SERVICE_H
