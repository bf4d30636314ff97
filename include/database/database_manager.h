#ifndef DATABASE_MANAGER_H
#define DATABASE_MANAGER_H

#include <sqlite3.h>
#include <string>
#include <mutex>
#include "database/db_status.h"

namespace db {

/**
 * @brief 数据库管理器 (单例)
 * 负责 SQLite 连接的生命周期管理
 *
 * 所有线程共享同一个连接, 每条语句都须在 lock() 返回的锁内执行;
 * 事务 (Transaction) 在整个生命周期内持有该锁, 因此同一用户的并发状态切换会被串行化。
 */
class DatabaseManager {
public:
    static DatabaseManager& instance();

    ~DatabaseManager();

    // 打开数据库, 支持 ":memory:"
    bool open(const std::string& path);

    // 关闭数据库
    void close();

    // 执行无返回值的 SQL (建表、插入、更新等)
    bool execute(const std::string& sql);

    // 连接锁 (可重入, 事务内的 DAO 调用会再次加锁)
    std::unique_lock<std::recursive_mutex> lock() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    // 获取原始句柄 (供 DAO 使用)
    sqlite3* connection() const { return db_; }

    // 检查是否已连接
    bool is_open() const { return db_ != nullptr; }

private:
    DatabaseManager();
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // 创建必要的表结构
    bool create_tables();

    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
};

/**
 * @brief 事务 (RAII)
 * 构造时 BEGIN IMMEDIATE, 未 commit() 即析构则自动回滚。
 */
class Transaction {
public:
    explicit Transaction(DatabaseManager& manager);
    ~Transaction();

    // BEGIN 是否成功
    bool begun() const { return active_; }
    const Status& begin_status() const { return begin_status_; }

    Status commit();

    // 回滚失败会单独记录日志
    Status rollback();

private:
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    DatabaseManager& manager_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_ = false;
    Status begin_status_;
};

} // namespace db

#endif // DATABASE_MANAGER_H
