/**
 * @file user_state_dao.cc
 * @brief 用户状态数据访问对象实现
 */

#include "database/user_state_dao.h"
#include "database/database_manager.h"
#include <iostream>

namespace db {

namespace {

// 列顺序: uid, state, since_unix_s
Status scan_user_state(sqlite3_stmt* stmt, UserState& out) {
    if (sqlite3_column_type(stmt, 0) != SQLITE_INTEGER) {
        return Status::scan_error("user_states.uid is not an integer");
    }
    int64_t uid = sqlite3_column_int64(stmt, 0);

    const char* code = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    ClockState state;
    if (!code || !parse_clock_state(code, state)) {
        return Status::scan_error("invalid state '" + std::string(code ? code : "NULL") +
                                  "' for uid " + std::to_string(uid));
    }

    if (sqlite3_column_type(stmt, 2) != SQLITE_INTEGER) {
        return Status::scan_error("since_unix_s is not an integer for uid " + std::to_string(uid));
    }

    out.uid = uid;
    out.state = state;
    out.since = static_cast<std::time_t>(sqlite3_column_int64(stmt, 2));
    return Status::ok_status();
}

Status collect_states(sqlite3* db, const char* sql, std::vector<UserState>& out) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        UserState s;
        Status status = scan_user_state(stmt, s);
        if (!status.ok()) {
            // 批量扫描: 跳过非法行
            std::cerr << "Skipping user_states row: " << status.to_string() << std::endl;
            continue;
        }
        out.push_back(s);
    }

    Status result;
    if (rc != SQLITE_DONE) {
        result = Status::lookup_error(std::string("scan user_states failed: ") + sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
    return result;
}

} // namespace

Status UserStateDao::create(const UserState& state) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "INSERT INTO user_states (uid, state, since_unix_s) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    const std::string code(1, clock_state_code(state.state));
    sqlite3_bind_int64(stmt, 1, state.uid);
    sqlite3_bind_text(stmt, 2, code.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(state.since));

    Status result;
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        std::cerr << "Insert user state failed: " << sqlite3_errmsg(db) << std::endl;
        result = Status::lookup_error("failed to create user state for uid " +
                                      std::to_string(state.uid) + ": " + sqlite3_errmsg(db));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status UserStateDao::get(int64_t uid, UserState& out) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "SELECT uid, state, since_unix_s FROM user_states WHERE uid = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, uid);

    Status result;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        // 单行查询: 非法行直接报错
        result = scan_user_state(stmt, out);
    } else if (rc == SQLITE_DONE) {
        result = Status::lookup_error("no row in user_states for uid " + std::to_string(uid));
    } else {
        result = Status::lookup_error(std::string("query user_states failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status UserStateDao::set_state(int64_t uid, ClockState state, std::time_t since) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "UPDATE user_states SET state = ?, since_unix_s = ? WHERE uid = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    const std::string code(1, clock_state_code(state));
    sqlite3_bind_text(stmt, 1, code.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(since));
    sqlite3_bind_int64(stmt, 3, uid);

    Status result;
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        result = Status::lookup_error(std::string("update user state failed: ") + sqlite3_errmsg(db));
    } else if (sqlite3_changes(db) == 0) {
        result = Status::lookup_error("no row in user_states for uid " + std::to_string(uid));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status UserStateDao::list_clocked_in(std::vector<UserState>& out) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    return collect_states(db, "SELECT uid, state, since_unix_s FROM user_states WHERE state = 'I' ORDER BY uid", out);
}

Status UserStateDao::list_all(std::vector<UserState>& out) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    return collect_states(db, "SELECT uid, state, since_unix_s FROM user_states ORDER BY uid", out);
}

Status UserStateDao::clock_out_all(std::time_t since, std::time_t cutoff, int& changed) {
    changed = 0;
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    // 只翻转 since 为整数的行; 扫描时被跳过的损坏行保持原样
    const char* sql = "UPDATE user_states SET state = 'O', since_unix_s = ? "
                      "WHERE state = 'I' AND typeof(since_unix_s) = 'integer' AND since_unix_s <= ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(since));
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(cutoff));

    Status result;
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        result = Status::lookup_error(std::string("bulk clock-out failed: ") + sqlite3_errmsg(db));
    } else {
        changed = sqlite3_changes(db);
    }

    sqlite3_finalize(stmt);
    return result;
}

} // namespace db
