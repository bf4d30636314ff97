/**
 * @file entry_dao.cc
 * @brief 工时记录数据访问对象实现
 */

#include "database/entry_dao.h"
#include "database/database_manager.h"
#include <iostream>

namespace db {

namespace {

// 列顺序: eid, uid, from_unix_s, to_unix_s, valid
Status scan_entry(sqlite3_stmt* stmt, Entry& out) {
    for (int col = 0; col < 5; ++col) {
        if (sqlite3_column_type(stmt, col) != SQLITE_INTEGER) {
            return Status::scan_error(std::string("entries.") + sqlite3_column_name(stmt, col) +
                                      " is not an integer");
        }
    }

    int valid = sqlite3_column_int(stmt, 4);
    if (valid != 0 && valid != 1) {
        return Status::scan_error("invalid valid flag " + std::to_string(valid) +
                                  " for eid " + std::to_string(sqlite3_column_int64(stmt, 0)));
    }

    out.eid = sqlite3_column_int64(stmt, 0);
    out.uid = sqlite3_column_int64(stmt, 1);
    out.from = static_cast<std::time_t>(sqlite3_column_int64(stmt, 2));
    out.to = static_cast<std::time_t>(sqlite3_column_int64(stmt, 3));
    out.valid = (valid == 1);
    return Status::ok_status();
}

// 执行已绑定参数的查询并收集结果; 负责 finalize
Status collect_entries(sqlite3* db, sqlite3_stmt* stmt, std::vector<Entry>& out) {
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Entry e;
        Status status = scan_entry(stmt, e);
        if (!status.ok()) {
            std::cerr << "Skipping entries row: " << status.to_string() << std::endl;
            continue;
        }
        out.push_back(e);
    }

    Status result;
    if (rc != SQLITE_DONE) {
        result = Status::lookup_error(std::string("scan entries failed: ") + sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
    return result;
}

} // namespace

Status EntryDao::add_entry(const Entry& entry, int64_t& new_eid) {
    new_eid = -1;
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "INSERT INTO entries (uid, from_unix_s, to_unix_s, valid) VALUES (?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, entry.uid);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(entry.from));
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(entry.to));
    sqlite3_bind_int(stmt, 4, entry.valid ? 1 : 0);

    Status result;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_eid = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert entry failed: " << sqlite3_errmsg(db) << std::endl;
        result = Status::lookup_error(std::string("insert entry failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status EntryDao::get_entry(int64_t eid, Entry& out) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "SELECT eid, uid, from_unix_s, to_unix_s, valid FROM entries WHERE eid = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, eid);

    Status result;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        result = scan_entry(stmt, out);
    } else if (rc == SQLITE_DONE) {
        result = Status::lookup_error("no entry with eid " + std::to_string(eid));
    } else {
        result = Status::lookup_error(std::string("query entry failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status EntryDao::update_range(int64_t eid, std::time_t from, std::time_t to) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "UPDATE entries SET from_unix_s = ?, to_unix_s = ? WHERE eid = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(from));
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(to));
    sqlite3_bind_int64(stmt, 3, eid);

    Status result;
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        result = Status::lookup_error(std::string("failed to edit entry: ") + sqlite3_errmsg(db));
    } else if (sqlite3_changes(db) == 0) {
        result = Status::lookup_error("no entry with eid " + std::to_string(eid));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status EntryDao::delete_entry(int64_t eid) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "DELETE FROM entries WHERE eid = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, eid);

    Status result;
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        result = Status::lookup_error(std::string("failed to delete entry: ") + sqlite3_errmsg(db));
    } else if (sqlite3_changes(db) == 0) {
        result = Status::lookup_error("no entry with eid " + std::to_string(eid));
    }

    sqlite3_finalize(stmt);
    return result;
}

Status EntryDao::get_entries_by_user(int64_t uid, std::vector<Entry>& out) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql = "SELECT eid, uid, from_unix_s, to_unix_s, valid FROM entries WHERE uid = ? ORDER BY from_unix_s ASC, eid ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("failed to list entries: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, uid);
    return collect_entries(db, stmt, out);
}

Status EntryDao::get_valid_entries_within(int64_t uid, std::time_t start, std::time_t end, std::vector<Entry>& out) {
    auto lock = DatabaseManager::instance().lock();
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return Status::lookup_error("database not open");

    const char* sql =
        "SELECT eid, uid, from_unix_s, to_unix_s, valid FROM entries "
        "WHERE uid = ? AND valid = 1 AND from_unix_s > ? AND to_unix_s < ? "
        "ORDER BY from_unix_s ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::lookup_error(std::string("failed to get entries in date range: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, uid);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(start));
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(end));
    return collect_entries(db, stmt, out);
}

} // namespace db
