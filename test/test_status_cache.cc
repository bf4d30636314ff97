// ============================================================================
// test_status_cache.cc - 状态快照与缓存测试
// ============================================================================
// Tests:
//   1. 快照内容: 状态、since、今日/本月差额
//   2. 缓存命中与过期
//   3. 经由缓存签到/签退后立即失效
//   4. 未知用户不写入缓存
//   5. 刷新过程中发生的签到不会被旧快照覆盖
// ============================================================================

#include "test_helpers.h"
#include "service/status_service.h"

using db::ClockState;
using service::make_local_time;

struct FakeMonotonic {
    int64_t now_ms = 0;

    service::MonotonicMsFn fn() {
        return [this]() { return now_ms; };
    }
};

void test_snapshot_contents() {
    TEST_SECTION("Status snapshot");
    reset_database();
    FakeClock clock;
    clock.now = make_local_time(2024, 1, 3, 11); // 周三
    insert_user(1, ClockState::In, make_local_time(2024, 1, 3, 9));
    insert_entry(1, make_local_time(2024, 1, 2, 9), make_local_time(2024, 1, 2, 18));

    service::StatusService status_service(clock.fn());
    service::UserStatus st;
    TEST_ASSERT(status_service.get_status(1, st).ok(), "status computed");
    TEST_ASSERT(st.uid == 1, "uid");
    TEST_ASSERT(st.state == ClockState::In, "state");
    TEST_ASSERT(st.since == make_local_time(2024, 1, 3, 9), "since");
    TEST_ASSERT(st.day_delta == 2 * 3600 - 28800, "today: 2h open session minus 8h");
    // 1-1 至 1-3 三个工作日, 已记 9h, 进行中 2h
    TEST_ASSERT(st.month_delta == 11 * 3600 - 3 * 28800, "month to date");
}

void test_cache_expiry() {
    TEST_SECTION("Cache hit and expiry");
    reset_database();
    FakeClock clock;
    clock.now = make_local_time(2024, 1, 3, 11);
    insert_user(1, ClockState::Out, make_local_time(2024, 1, 2, 18));

    FakeMonotonic mono;
    mono.now_ms = 1000;
    service::StatusService status_service(clock.fn());
    service::AttendanceService attendance(clock.fn());
    service::StatusCache cache(status_service, attendance, 60 * 1000, mono.fn());

    service::UserStatus st;
    TEST_ASSERT(!cache.get(1, st), "empty cache misses");
    TEST_ASSERT(cache.refresh(1, st).ok(), "refresh");
    TEST_ASSERT(st.state == ClockState::Out, "refreshed value");

    // 绕过缓存修改状态, 缓存仍返回旧值
    db::UserStateDao dao;
    dao.set_state(1, ClockState::In, clock.now);
    mono.now_ms += 60 * 1000;
    service::UserStatus cached;
    TEST_ASSERT(cache.get(1, cached), "still fresh at exactly the TTL");
    TEST_ASSERT(cached.state == ClockState::Out, "stale value served while fresh");

    mono.now_ms += 1;
    TEST_ASSERT(!cache.get(1, cached), "expired after the TTL");
    TEST_ASSERT(cache.get_or_refresh(1, cached).ok(), "get_or_refresh recomputes");
    TEST_ASSERT(cached.state == ClockState::In, "new value after refresh");
}

void test_invalidated_by_local_writes() {
    TEST_SECTION("Local clock-in / clock-out invalidates");
    reset_database();
    FakeClock clock;
    clock.now = make_local_time(2024, 1, 3, 8);
    FakeMonotonic mono;
    service::StatusService status_service(clock.fn());
    service::AttendanceService attendance(clock.fn());
    service::StatusCache cache(status_service, attendance, 60 * 1000, mono.fn());
    attendance.provision_user(1);

    service::UserStatus st;
    TEST_ASSERT(cache.refresh(1, st).ok() && st.state == ClockState::Out, "initially Out");

    clock.now = make_local_time(2024, 1, 3, 9);
    TEST_ASSERT(cache.clock_in(1).ok(), "clock-in through the cache");
    TEST_ASSERT(!cache.get(1, st), "entry invalidated by clock-in");
    TEST_ASSERT(cache.get_or_refresh(1, st).ok() && st.state == ClockState::In, "refreshed to In");

    clock.now = make_local_time(2024, 1, 3, 17);
    TEST_ASSERT(cache.clock_out(1).ok(), "clock-out through the cache");
    TEST_ASSERT(!cache.get(1, st), "entry invalidated by clock-out");
    TEST_ASSERT(cache.get_or_refresh(1, st).ok(), "refresh");
    TEST_ASSERT(st.state == ClockState::Out && st.day_delta == 0, "8h worked, balanced");
}

void test_unknown_user_not_cached() {
    TEST_SECTION("Unknown user");
    reset_database();
    FakeMonotonic mono;
    service::StatusService status_service;
    service::AttendanceService attendance;
    service::StatusCache cache(status_service, attendance, 60 * 1000, mono.fn());

    service::UserStatus st;
    db::Status status = cache.get_or_refresh(5, st);
    TEST_ASSERT(status.code() == db::ErrorCode::LOOKUP_ERROR, "LookupError");
    TEST_ASSERT(!cache.get(5, st), "nothing cached");
    TEST_ASSERT(cache.clock_in(5).code() == db::ErrorCode::TRANSACTION_ERROR, "clock-in error passed through");
}

void test_clock_in_during_refresh() {
    TEST_SECTION("Clock-in while a refresh is computing");
    reset_database();
    FakeClock clock;
    clock.now = make_local_time(2024, 1, 3, 8);
    FakeMonotonic mono;
    service::AttendanceService attendance(clock.fn());
    attendance.provision_user(1);

    // 状态行读出之后、快照写入缓存之前插入一次签到
    service::StatusCache* cache_ptr = nullptr;
    bool write_pending = true;
    db::Status write_status;
    service::NowFn now_with_write = [&]() {
        if (write_pending && cache_ptr) {
            write_pending = false;
            clock.now = make_local_time(2024, 1, 3, 9);
            write_status = cache_ptr->clock_in(1);
        }
        return clock.now;
    };
    service::StatusService status_service(now_with_write);
    service::StatusCache cache(status_service, attendance, 60 * 1000, mono.fn());
    cache_ptr = &cache;

    service::UserStatus st;
    TEST_ASSERT(cache.refresh(1, st).ok(), "refresh returns its result");
    TEST_ASSERT(!write_pending && write_status.ok(), "clock-in ran during the refresh");
    TEST_ASSERT(st.state == ClockState::Out, "result computed before the clock-in");
    TEST_ASSERT(state_of(1).state == ClockState::In, "database is In");
    TEST_ASSERT(!cache.get(1, st), "older snapshot not cached");
    TEST_ASSERT(cache.get_or_refresh(1, st).ok() && st.state == ClockState::In, "next read sees In");
    TEST_ASSERT(cache.get(1, st) && st.state == ClockState::In, "undisturbed refresh is cached");
}

int main() {
    use_timezone("UTC0");
    std::cout << "=== Status Cache Tests ===\n";

    test_snapshot_contents();
    test_cache_expiry();
    test_invalidated_by_local_writes();
    test_unknown_user_not_cached();
    test_clock_in_during_refresh();

    return print_summary();
}
