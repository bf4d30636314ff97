/**
 * @file balance_calculator.h
 * @brief 工时差额 (实际工时 - 应出勤工时) 计算
 */

#ifndef BALANCE_CALCULATOR_H
#define BALANCE_CALCULATOR_H

#include "database/database_types.h"
#include "database/db_status.h"
#include "service/time_utils.h"

namespace service {

/**
 * @brief 工时差额计算 (只读)
 *
 * delta = 窗口内有效记录时长之和 - 8h * 窗口内工作日数 + 当前未结束会话时长
 *
 * - 记录必须完全落在窗口内 (from > start 且 to < end), 跨边界的记录不计入;
 * - 周六、周日应出勤为 0;
 * - 用户当前为 In 时加上 (now - since), 与窗口无关, 因此结果随时间实时变化;
 * - 状态与记录分两次读取, 不加锁, 期间若会话恰好结束, 结果可能不一致。
 */
class BalanceCalculator {
public:
    explicit BalanceCalculator(NowFn now = system_now);

    // 窗口: [当天零点, 次日零点)
    db::Status get_delta_for_day(int64_t uid, std::time_t date, int64_t& delta);

    // 窗口: [当月 1 日零点, date 次日零点), 即截至 date 的当月累计
    db::Status get_delta_for_month(int64_t uid, std::time_t date, int64_t& delta);

    // 未结束会话的贡献, 每次读取时现算
    static int64_t open_session_seconds(const db::UserState& state, std::time_t now);

private:
    db::Status compute_delta(int64_t uid, std::time_t window_start, std::time_t window_end, int64_t& delta);

    NowFn now_;
};

} // namespace service

#endif // BALANCE_CALCULATOR_H
