/**
 * @file config.h
 * @brief 全局配置常量 - 集中管理所有可调参数
 *
 * 配置分类：
 * - [固定] 系统常量，不可通过命令行修改
 * - [默认] 可由命令行参数覆盖的默认值
 *
 * 使用方法：
 *   #include "config.h"
 *   int64_t expected = Config::Attendance::EXPECTED_WORKDAY_SECONDS;  // 固定常量
 *   int hour = Config::Default::SWEEP_HOUR;                           // 默认值
 *
 * 时区：所有按天/按月的边界计算均使用进程本地时区 (环境变量 TZ)。
 */

#pragma once

#include <cstdint>

namespace Config {

// ==================== 路径配置 [默认] ====================
namespace Path {
    constexpr const char* DATABASE = "./timeclock.db";
}

// ==================== 考勤规则 [固定] ====================
namespace Attendance {
    constexpr int64_t EXPECTED_WORKDAY_SECONDS = 8 * 60 * 60;  // 工作日应出勤 8 小时, 周末为 0
}

// ==================== 存储参数 [固定] ====================
namespace Storage {
    constexpr int BUSY_TIMEOUT_MS = 5000;          // 其他连接持有写锁时的等待上限
}

// ==================== 默认值 [命令行可配置] ====================
namespace Default {
    // 失效清理 (未签退会话) 每日执行时间, 本地时间
    constexpr int SWEEP_HOUR = 0;
    constexpr int SWEEP_MINUTE = 0;

    // 状态快照缓存有效期 (毫秒)
    constexpr int64_t STATUS_CACHE_TTL_MS = 60 * 1000;
}

} // namespace Config
