/**
 * @file disqualification_sweep.h
 * @brief 未签退会话的失效清理
 */

#ifndef DISQUALIFICATION_SWEEP_H
#define DISQUALIFICATION_SWEEP_H

#include "database/db_status.h"
#include "service/time_utils.h"

namespace service {

struct SweepReport {
    std::time_t run_at = 0;     // 本次清理使用的 now
    int candidates = 0;         // since 不晚于 run_at 的已签到用户
    int disqualified = 0;       // 成功写入失效记录
    int failed = 0;             // 写入失败 (已记录日志并跳过)
    int clocked_out = 0;        // 批量签退影响的行数
};

/**
 * @brief 失效清理
 *
 * 对每个已签到用户写入一条 {from: since, to: now, valid: false} 的记录,
 * 然后用一条批量 UPDATE 将这些用户置为 Out (since=now)。
 * 两步不在同一事务中: 两步之间崩溃可能留下 "已有失效记录但仍为 In" 的用户。
 * 单行写入失败只记录日志, 不影响其余行及批量签退。
 */
class DisqualificationSweep {
public:
    explicit DisqualificationSweep(NowFn now = system_now);

    // 只有扫描或批量签退本身失败时返回错误
    db::Status run(SweepReport& report);

private:
    NowFn now_;
};

} // namespace service

#endif // DISQUALIFICATION_SWEEP_H
