/**
 * @file attendance_service.cc
 * @brief 考勤业务逻辑实现
 * @details 签到/签退状态切换与工时记录落库。两张表的写入放在同一事务中,
 *          原子性交给 SQLite; 并发切换同一用户时, 后到者读到已提交的状态, 走幂等分支。
 */

#include "service/attendance_service.h"
#include "database/database_manager.h"
#include "database/entry_dao.h"
#include "database/user_state_dao.h"
#include <iostream>
#include <utility>

namespace service {

namespace {

// 回滚并包装错误; 回滚本身失败时一并带上
db::Status abort_transaction(db::Transaction& tx, const db::Status& cause, const std::string& step) {
    std::string message = cause.wrap(step).to_string();
    db::Status rollback_status = tx.rollback();
    if (!rollback_status.ok()) {
        message += " (" + rollback_status.message() + ")";
    }
    return db::Status::transaction_error(message);
}

} // namespace

AttendanceService::AttendanceService(NowFn now) : now_(std::move(now)) {}

db::Status AttendanceService::provision_user(int64_t uid) {
    db::UserState state;
    state.uid = uid;
    state.state = db::ClockState::Out;
    state.since = now_();

    db::UserStateDao dao;
    return dao.create(state);
}

db::Status AttendanceService::clock_in(int64_t uid) {
    db::Transaction tx(db::DatabaseManager::instance());
    if (!tx.begun()) {
        return tx.begin_status();
    }

    db::UserStateDao state_dao;
    db::UserState current;
    db::Status status = state_dao.get(uid, current);
    if (!status.ok()) {
        return abort_transaction(tx, status, "failed to find a row in user_states for uid " + std::to_string(uid));
    }

    if (current.state == db::ClockState::In) {
        return tx.rollback(); // 已签到
    }

    status = state_dao.set_state(uid, db::ClockState::In, now_());
    if (!status.ok()) {
        return abort_transaction(tx, status, "failed to update user state");
    }

    status = tx.commit();
    if (status.ok()) {
        std::cout << "User " << uid << " clocked in" << std::endl;
    }
    return status;
}

db::Status AttendanceService::clock_out(int64_t uid) {
    db::Transaction tx(db::DatabaseManager::instance());
    if (!tx.begun()) {
        return tx.begin_status();
    }

    db::UserStateDao state_dao;
    db::UserState current;
    db::Status status = state_dao.get(uid, current);
    if (!status.ok()) {
        return abort_transaction(tx, status, "failed to find a row in user_states for uid " + std::to_string(uid));
    }

    if (current.state == db::ClockState::Out) {
        return tx.rollback(); // 已签退
    }

    // 两次写入共用同一个 now
    const std::time_t now = now_();

    db::Entry entry;
    entry.uid = uid;
    entry.from = current.since;
    entry.to = now;
    entry.valid = true;

    db::EntryDao entry_dao;
    int64_t eid = -1;
    status = entry_dao.add_entry(entry, eid);
    if (!status.ok()) {
        return abort_transaction(tx, status, "failed to insert an entry");
    }

    status = state_dao.set_state(uid, db::ClockState::Out, now);
    if (!status.ok()) {
        return abort_transaction(tx, status, "failed to update user state");
    }

    status = tx.commit();
    if (status.ok()) {
        std::cout << "User " << uid << " clocked out, entry " << eid
                  << " (" << (entry.to - entry.from) << "s)" << std::endl;
    }
    return status;
}

db::Status AttendanceService::edit_entry(int64_t eid, std::time_t from, std::time_t to) {
    db::EntryDao dao;
    return dao.update_range(eid, from, to).wrap("failed to edit entry");
}

db::Status AttendanceService::delete_entry(int64_t eid) {
    db::EntryDao dao;
    return dao.delete_entry(eid).wrap("failed to delete entry");
}

} // namespace service
