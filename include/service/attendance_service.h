/**
 * @file attendance_service.h
 * @brief 考勤业务服务头文件 (签到/签退状态机)
 */

#ifndef ATTENDANCE_SERVICE_H
#define ATTENDANCE_SERVICE_H

#include "database/database_types.h"
#include "database/db_status.h"
#include "service/time_utils.h"

namespace service {

/**
 * @brief 签到/签退状态机
 *
 * user_states 与 entries 的唯一写入方 (失效清理除外)。
 * clock_in / clock_out 在单个事务内完成; 任一步骤失败都会回滚,
 * 不会出现 "有记录但状态未切换" 或相反的情况。
 * 重复签到/签退为幂等空操作, 对调用方与成功无异。
 */
class AttendanceService {
public:
    explicit AttendanceService(NowFn now = system_now);

    /**
     * @brief 开通用户: 创建初始状态行 (Out, since=now)
     */
    db::Status provision_user(int64_t uid);

    /**
     * @brief 签到
     * @return 用户不存在或提交失败时返回 TRANSACTION_ERROR
     */
    db::Status clock_in(int64_t uid);

    /**
     * @brief 签退: 追加 {from: since, to: now} 的有效记录并将状态置为 Out
     * 记录的结束时间与新的 since 使用同一个 now
     */
    db::Status clock_out(int64_t uid);

    // 管理员修正, 不检查任何跨表约束 (from 可以晚于 to)
    db::Status edit_entry(int64_t eid, std::time_t from, std::time_t to);
    db::Status delete_entry(int64_t eid);

private:
    NowFn now_;
};

} // namespace service

#endif // ATTENDANCE_SERVICE_H
