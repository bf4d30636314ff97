/**
 * @file status_service.cc
 * @brief 用户状态快照及缓存实现
 */

#include "service/status_service.h"
#include "database/user_state_dao.h"
#include <chrono>
#include <utility>

namespace service {

StatusService::StatusService(NowFn now) : now_(now), balance_(now) {}

db::Status StatusService::get_status(int64_t uid, UserStatus& out) {
    db::UserStateDao dao;
    db::UserState state;
    db::Status status = dao.get(uid, state);
    if (!status.ok()) {
        return status;
    }

    const std::time_t today = now_();
    UserStatus result;
    result.uid = uid;
    result.state = state.state;
    result.since = state.since;

    status = balance_.get_delta_for_day(uid, today, result.day_delta);
    if (!status.ok()) {
        return status.wrap("failed to compute day delta");
    }
    status = balance_.get_delta_for_month(uid, today, result.month_delta);
    if (!status.ok()) {
        return status.wrap("failed to compute month delta");
    }

    out = result;
    return db::Status::ok_status();
}

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

StatusCache::StatusCache(StatusService& status_service, AttendanceService& attendance,
                         int64_t ttl_ms, MonotonicMsFn clock)
    : status_service_(status_service)
    , attendance_(attendance)
    , ttl_ms_(ttl_ms)
    , clock_(std::move(clock))
{
}

bool StatusCache::get(int64_t uid, UserStatus& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(uid);
    if (it == cache_.end() || it->second.expires_at_ms < clock_()) {
        return false;
    }
    out = it->second.status;
    return true;
}

db::Status StatusCache::refresh(int64_t uid, UserStatus& out) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generations_[uid];
    }

    UserStatus fresh;
    db::Status status = status_service_.get_status(uid, fresh);
    if (!status.ok()) {
        return status;
    }

    out = fresh;
    std::lock_guard<std::mutex> lock(mutex_);
    // 计算期间发生过失效, 结果可能早于写入, 不缓存
    if (generations_[uid] != generation) {
        return status;
    }
    CachedStatus& slot = cache_[uid];
    slot.status = fresh;
    slot.expires_at_ms = clock_() + ttl_ms_;
    return status;
}

db::Status StatusCache::get_or_refresh(int64_t uid, UserStatus& out) {
    if (get(uid, out)) {
        return db::Status::ok_status();
    }
    return refresh(uid, out);
}

void StatusCache::invalidate(int64_t uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generations_[uid];
    cache_.erase(uid);
}

db::Status StatusCache::clock_in(int64_t uid) {
    db::Status status = attendance_.clock_in(uid);
    invalidate(uid);
    return status;
}

db::Status StatusCache::clock_out(int64_t uid) {
    db::Status status = attendance_.clock_out(uid);
    invalidate(uid);
    return status;
}

} // namespace service
