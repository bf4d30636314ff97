#ifndef DATABASE_TYPES_H
#define DATABASE_TYPES_H

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace db {

/**
 * @brief 用户打卡状态
 * 库中以单字符存储: 'O' = 已签退, 'I' = 已签到
 */
enum class ClockState {
    Out,
    In
};

inline char clock_state_code(ClockState state) {
    return state == ClockState::In ? 'I' : 'O';
}

// 未知字符返回 false
inline bool parse_clock_state(const std::string& code, ClockState& out) {
    if (code == "I") {
        out = ClockState::In;
        return true;
    }
    if (code == "O") {
        out = ClockState::Out;
        return true;
    }
    return false;
}

/**
 * @brief 用户状态 (每个用户一行)
 * since 始终是最近一次状态切换的时刻
 */
struct UserState {
    int64_t uid = -1;                       // 主键
    ClockState state = ClockState::Out;     // 当前状态
    std::time_t since = 0;                  // 最近一次切换时间 (Unix 秒)
};

/**
 * @brief 工时记录 (一个已结束的会话)
 * 由签退生成 (valid=true) 或由失效清理生成 (valid=false)
 */
struct Entry {
    int64_t eid = -1;           // 主键
    int64_t uid = -1;           // 用户ID
    std::time_t from = 0;       // 会话开始
    std::time_t to = 0;         // 会话结束
    bool valid = true;          // false = 被判定失效, 不计入工时
};

} // namespace db

#endif // DATABASE_TYPES_H
