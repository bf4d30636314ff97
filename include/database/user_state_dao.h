#ifndef USER_STATE_DAO_H
#define USER_STATE_DAO_H

#include "database/database_types.h"
#include "database/db_status.h"
#include <vector>

namespace db {

class UserStateDao {
public:
    // 开通用户 (状态行须在签到前由外部创建)
    Status create(const UserState& state);

    // 单行查询: 不存在 -> LOOKUP_ERROR, 格式非法 -> SCAN_ERROR
    Status get(int64_t uid, UserState& out);

    // 更新状态, 用户不存在 -> LOOKUP_ERROR
    Status set_state(int64_t uid, ClockState state, std::time_t since);

    // 所有已签到用户; 非法行记录日志后跳过
    Status list_clocked_in(std::vector<UserState>& out);

    // 所有用户; 非法行记录日志后跳过
    Status list_all(std::vector<UserState>& out);

    // 批量签退: 将 since <= cutoff 的已签到用户置为 Out, since 设为 since
    Status clock_out_all(std::time_t since, std::time_t cutoff, int& changed);
};

} // namespace db

#endif // USER_STATE_DAO_H
