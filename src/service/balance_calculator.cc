/**
 * @file balance_calculator.cc
 * @brief 工时差额计算实现
 */

#include "service/balance_calculator.h"
#include "config.h"
#include "database/entry_dao.h"
#include "database/user_state_dao.h"
#include <utility>
#include <vector>

namespace service {

BalanceCalculator::BalanceCalculator(NowFn now) : now_(std::move(now)) {}

db::Status BalanceCalculator::get_delta_for_day(int64_t uid, std::time_t date, int64_t& delta) {
    return compute_delta(uid, start_of_day(date), start_of_next_day(date), delta);
}

db::Status BalanceCalculator::get_delta_for_month(int64_t uid, std::time_t date, int64_t& delta) {
    return compute_delta(uid, start_of_month(date), start_of_next_day(date), delta);
}

int64_t BalanceCalculator::open_session_seconds(const db::UserState& state, std::time_t now) {
    if (state.state != db::ClockState::In) {
        return 0;
    }
    return static_cast<int64_t>(now - state.since);
}

db::Status BalanceCalculator::compute_delta(int64_t uid, std::time_t window_start, std::time_t window_end, int64_t& delta) {
    delta = 0;

    db::EntryDao entry_dao;
    std::vector<db::Entry> entries;
    db::Status status = entry_dao.get_valid_entries_within(uid, window_start, window_end, entries);
    if (!status.ok()) {
        return db::Status::lookup_error(status.to_string()).wrap("failed to read entries");
    }

    int64_t worked = 0;
    for (const auto& e : entries) {
        worked += static_cast<int64_t>(e.to - e.from);
    }

    // TODO: 节假日 (目前只区分周末)
    int64_t expected = static_cast<int64_t>(count_weekdays(window_start, window_end)) *
                       Config::Attendance::EXPECTED_WORKDAY_SECONDS;

    db::UserStateDao state_dao;
    db::UserState state;
    status = state_dao.get(uid, state);
    if (!status.ok()) {
        // 读路径统一报 LookupError, 原因保留在消息里
        return db::Status::lookup_error(status.to_string()).wrap("failed to get user info");
    }

    delta = worked - expected + open_session_seconds(state, now_());
    return db::Status::ok_status();
}

} // namespace service
