/**
 * @file database_manager.cc
 * @brief 数据库连接管理实现
 * @details 负责 SQLite 数据库的打开、关闭、事务处理以及 user_states / entries 表结构的自动创建。
 */

#include "database/database_manager.h"
#include "config.h"
#include <iostream>

namespace db {

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager instance;
    return instance;
}

DatabaseManager::DatabaseManager() {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        return true; // 已经打开
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "Can't open database: " << (db_ ? sqlite3_errmsg(db_) : "out of memory") << std::endl;
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_busy_timeout(db_, Config::Storage::BUSY_TIMEOUT_MS);

    // 开启外键约束支持
    if (!execute("PRAGMA foreign_keys = ON;")) {
        close();
        return false;
    }

    // 创建表结构
    if (!create_tables()) {
        close();
        return false;
    }

    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) return false;

    char* zErrMsg = 0;
    int rc = sqlite3_exec(db_, sql.c_str(), 0, 0, &zErrMsg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (zErrMsg ? zErrMsg : sqlite3_errmsg(db_)) << "\nSQL: " << sql << std::endl;
        sqlite3_free(zErrMsg);
        return false;
    }
    return true;
}

bool DatabaseManager::create_tables() {
    // state: 'I' = 已签到, 'O' = 已签退
    const char* sql_states =
        "CREATE TABLE IF NOT EXISTS user_states ("
        "uid INTEGER PRIMARY KEY,"
        "state TEXT NOT NULL,"
        "since_unix_s INTEGER NOT NULL"
        ");";

    const char* sql_entries =
        "CREATE TABLE IF NOT EXISTS entries ("
        "eid INTEGER PRIMARY KEY AUTOINCREMENT,"
        "uid INTEGER NOT NULL,"
        "from_unix_s INTEGER NOT NULL,"
        "to_unix_s INTEGER NOT NULL,"
        "valid INTEGER NOT NULL DEFAULT 1,"
        "FOREIGN KEY(uid) REFERENCES user_states(uid) ON DELETE CASCADE"
        ");";

    // 索引
    const char* sql_idx_user = "CREATE INDEX IF NOT EXISTS idx_entries_user ON entries(uid);";
    const char* sql_idx_from = "CREATE INDEX IF NOT EXISTS idx_entries_from ON entries(from_unix_s);";

    return execute(sql_states) &&
           execute(sql_entries) &&
           execute(sql_idx_user) &&
           execute(sql_idx_from);
}

// ==================== Transaction ====================

Transaction::Transaction(DatabaseManager& manager)
    : manager_(manager), lock_(manager.lock()) {
    sqlite3* db = manager_.connection();
    if (!db) {
        begin_status_ = Status::transaction_error("failed to begin transaction: database not open");
        return;
    }

    char* zErrMsg = 0;
    if (sqlite3_exec(db, "BEGIN IMMEDIATE TRANSACTION;", 0, 0, &zErrMsg) != SQLITE_OK) {
        begin_status_ = Status::transaction_error(
            std::string("failed to begin transaction: ") + (zErrMsg ? zErrMsg : sqlite3_errmsg(db)));
        sqlite3_free(zErrMsg);
        return;
    }
    active_ = true;
}

Transaction::~Transaction() {
    if (active_) {
        rollback();
    }
}

Status Transaction::commit() {
    if (!active_) {
        return Status::transaction_error("failed to commit transaction: no active transaction");
    }

    sqlite3* db = manager_.connection();
    char* zErrMsg = 0;
    if (sqlite3_exec(db, "COMMIT;", 0, 0, &zErrMsg) != SQLITE_OK) {
        Status status = Status::transaction_error(
            std::string("failed to commit transaction: ") + (zErrMsg ? zErrMsg : sqlite3_errmsg(db)));
        sqlite3_free(zErrMsg);
        // COMMIT 失败时事务可能仍处于打开状态
        if (!sqlite3_get_autocommit(db)) {
            rollback();
        }
        active_ = false;
        return status;
    }
    active_ = false;
    return Status::ok_status();
}

Status Transaction::rollback() {
    if (!active_) {
        return Status::ok_status();
    }
    active_ = false;

    sqlite3* db = manager_.connection();
    char* zErrMsg = 0;
    if (sqlite3_exec(db, "ROLLBACK;", 0, 0, &zErrMsg) != SQLITE_OK) {
        std::string reason = zErrMsg ? zErrMsg : sqlite3_errmsg(db);
        sqlite3_free(zErrMsg);
        std::cerr << "Rollback failed: " << reason << std::endl;
        return Status::transaction_error("failed to roll back transaction: " + reason);
    }
    return Status::ok_status();
}

} // namespace db
