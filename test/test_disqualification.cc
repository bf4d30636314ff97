// ============================================================================
// test_disqualification.cc - 失效清理测试
// ============================================================================
// Tests:
//   1. 未签退用户: 写入失效记录 {since, now} 并置为 Out (since=now)
//   2. 已签退用户不受影响, 多用户一次清理
//   3. 失效记录不计入工时差额, 但在列表中保留
//   4. 单行写入失败只跳过该行, 批量签退照常执行
//   5. 格式非法的行在扫描时跳过, 批量签退也不翻转
//   6. 清理开始后才签到的会话不受影响
// ============================================================================

#include "test_helpers.h"
#include "service/balance_calculator.h"
#include "service/disqualification_sweep.h"
#include "service/entry_query_service.h"
#include <sqlite3.h>

using db::ClockState;

static const std::time_t MON_0900 = 1704099600; // 2024-01-01 09:00:00 UTC (周一)

// 直接读 state 列, 绕过 DAO 的格式校验
static std::string raw_state_of(int64_t uid) {
    std::string state;
    auto lock = db::DatabaseManager::instance().lock();
    sqlite3* conn = db::DatabaseManager::instance().connection();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(conn, "SELECT state FROM user_states WHERE uid = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        return state;
    }
    sqlite3_bind_int64(stmt, 1, uid);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        if (text) state = reinterpret_cast<const char*>(text);
    }
    sqlite3_finalize(stmt);
    return state;
}

void test_disqualifies_open_session() {
    TEST_SECTION("Open session is disqualified");
    reset_database();
    insert_user(1, ClockState::In, MON_0900);

    FakeClock clock;
    clock.now = MON_0900 + 14 * 3600; // 当晚 23:00
    service::DisqualificationSweep sweep(clock.fn());
    service::SweepReport report;
    TEST_ASSERT(sweep.run(report).ok(), "sweep succeeds");

    TEST_ASSERT(report.run_at == clock.now, "report carries run time");
    TEST_ASSERT(report.candidates == 1, "one candidate");
    TEST_ASSERT(report.disqualified == 1, "one disqualified");
    TEST_ASSERT(report.clocked_out == 1, "one clocked out");

    auto entries = entries_of(1);
    TEST_ASSERT(entries.size() == 1, "one entry");
    if (entries.size() == 1) {
        TEST_ASSERT(!entries[0].valid, "entry is invalid");
        TEST_ASSERT(entries[0].from == MON_0900, "from = since");
        TEST_ASSERT(entries[0].to == clock.now, "to = sweep time");
    }

    db::UserState s = state_of(1);
    TEST_ASSERT(s.state == ClockState::Out, "state flipped to Out");
    TEST_ASSERT(s.since == clock.now, "since = sweep time");
}

void test_leaves_clocked_out_users_alone() {
    TEST_SECTION("Clocked-out users are untouched");
    reset_database();
    insert_user(1, ClockState::In, MON_0900);
    insert_user(2, ClockState::Out, MON_0900 - 100);
    insert_user(3, ClockState::In, MON_0900 + 600);

    FakeClock clock;
    clock.now = MON_0900 + 7200;
    service::DisqualificationSweep sweep(clock.fn());
    service::SweepReport report;
    TEST_ASSERT(sweep.run(report).ok(), "sweep succeeds");
    TEST_ASSERT(report.disqualified == 2, "two sessions disqualified");
    TEST_ASSERT(report.clocked_out == 2, "two users clocked out");

    TEST_ASSERT(entries_of(2).empty(), "no entry for Out user");
    db::UserState s2 = state_of(2);
    TEST_ASSERT(s2.state == ClockState::Out && s2.since == MON_0900 - 100, "Out user's since unchanged");

    auto e3 = entries_of(3);
    TEST_ASSERT(e3.size() == 1 && e3[0].from == MON_0900 + 600, "user 3 entry starts at its since");

    // 再跑一次没有候选
    TEST_ASSERT(sweep.run(report).ok(), "second sweep succeeds");
    TEST_ASSERT(report.candidates == 0 && report.clocked_out == 0, "nothing left to sweep");
    TEST_ASSERT(entries_of(1).size() == 1, "no duplicate entry");
}

void test_invalid_entries_excluded_from_balance() {
    TEST_SECTION("Disqualified entries are excluded from balance");
    reset_database();
    insert_user(1, ClockState::In, MON_0900);

    FakeClock clock;
    clock.now = MON_0900 + 9 * 3600;
    service::DisqualificationSweep sweep(clock.fn());
    service::SweepReport report;
    TEST_ASSERT(sweep.run(report).ok(), "sweep succeeds");

    service::BalanceCalculator balance(clock.fn());
    int64_t delta = 0;
    TEST_ASSERT(balance.get_delta_for_day(1, MON_0900, delta).ok(), "delta computed");
    TEST_ASSERT(delta == -28800, "9h disqualified session counts as zero");

    service::EntryQueryService query;
    service::EntriesByDay days;
    TEST_ASSERT(query.list_entries(1, days).ok(), "list entries");
    TEST_ASSERT(days.size() == 1 && days.begin()->second.size() == 1, "invalid entry kept for audit");
}

void test_insert_failure_is_skipped() {
    TEST_SECTION("Per-row insert failure is logged and skipped");
    reset_database();
    insert_user(1, ClockState::In, MON_0900);
    insert_user(2, ClockState::In, MON_0900 + 60);
    insert_user(3, ClockState::In, MON_0900 + 120);

    db::DatabaseManager::instance().execute(
        "CREATE TRIGGER fail_uid2 BEFORE INSERT ON entries WHEN NEW.uid = 2 "
        "BEGIN SELECT RAISE(ABORT, 'injected'); END;");

    FakeClock clock;
    clock.now = MON_0900 + 3600;
    service::DisqualificationSweep sweep(clock.fn());
    service::SweepReport report;
    TEST_ASSERT(sweep.run(report).ok(), "sweep as a whole succeeds");

    db::DatabaseManager::instance().execute("DROP TRIGGER fail_uid2;");

    TEST_ASSERT(report.candidates == 3, "three candidates");
    TEST_ASSERT(report.disqualified == 2, "two entries written");
    TEST_ASSERT(report.failed == 1, "one failure counted");
    TEST_ASSERT(report.clocked_out == 3, "bulk update still flips every user");

    TEST_ASSERT(entries_of(1).size() == 1, "user 1 entry");
    TEST_ASSERT(entries_of(2).empty(), "user 2 has no entry");
    TEST_ASSERT(entries_of(3).size() == 1, "user 3 entry written after the failure");
    TEST_ASSERT(state_of(2).state == ClockState::Out, "user 2 flipped anyway");
}

void test_malformed_row_is_skipped() {
    TEST_SECTION("Malformed row is skipped during the scan");
    reset_database();
    insert_user(1, ClockState::In, MON_0900);
    db::DatabaseManager::instance().execute(
        "INSERT INTO user_states (uid, state, since_unix_s) VALUES (9, 'I', 'garbage');");
    db::DatabaseManager::instance().execute(
        "INSERT INTO user_states (uid, state, since_unix_s) VALUES (10, 'I', 1.5);");

    FakeClock clock;
    clock.now = MON_0900 + 3600;
    service::DisqualificationSweep sweep(clock.fn());
    service::SweepReport report;
    TEST_ASSERT(sweep.run(report).ok(), "sweep succeeds");
    TEST_ASSERT(report.candidates == 1, "malformed row not a candidate");
    TEST_ASSERT(report.disqualified == 1, "valid user disqualified");
    TEST_ASSERT(entries_of(9).empty(), "no entry for malformed row");
    TEST_ASSERT(entries_of(10).empty(), "no entry for fractional since");
    TEST_ASSERT(state_of(1).state == ClockState::Out, "valid user flipped");
    TEST_ASSERT(report.clocked_out == 1, "only the valid user clocked out");
    TEST_ASSERT(raw_state_of(9) == "I", "text since not flipped");
    TEST_ASSERT(raw_state_of(10) == "I", "fractional since not flipped");
}

void test_session_started_after_sweep_time() {
    TEST_SECTION("Session newer than the sweep is left open");
    reset_database();
    FakeClock clock;
    clock.now = MON_0900 + 3600;
    insert_user(1, ClockState::In, MON_0900);
    insert_user(2, ClockState::In, clock.now + 30);

    service::DisqualificationSweep sweep(clock.fn());
    service::SweepReport report;
    TEST_ASSERT(sweep.run(report).ok(), "sweep succeeds");
    TEST_ASSERT(report.candidates == 1, "only the older session is a candidate");
    TEST_ASSERT(entries_of(2).empty(), "no entry for the newer session");
    db::UserState s2 = state_of(2);
    TEST_ASSERT(s2.state == ClockState::In && s2.since == clock.now + 30, "newer session still open");
}

int main() {
    use_timezone("UTC0");
    std::cout << "=== Disqualification Sweep Tests ===\n";

    test_disqualifies_open_session();
    test_leaves_clocked_out_users_alone();
    test_invalid_entries_excluded_from_balance();
    test_insert_failure_is_skipped();
    test_malformed_row_is_skipped();
    test_session_started_after_sweep_time();

    return print_summary();
}
