/**
 * @file db_status.h
 * @brief 数据层/业务层统一的错误返回值
 * @details 不使用异常; 失败原因以 Status 返回, 结果通过输出参数带回。
 */

#ifndef DB_STATUS_H
#define DB_STATUS_H

#include <string>

namespace db {

enum class ErrorCode {
    OK = 0,
    TRANSACTION_ERROR,  // 事务开始/提交/回滚失败, 或事务内任一步骤失败
    LOOKUP_ERROR,       // 预期的行不存在, 或读取失败
    SCAN_ERROR          // 库中的行格式非法
};

const char* error_code_name(ErrorCode code);

class Status {
public:
    Status() = default;

    static Status ok_status() { return Status(); }
    static Status transaction_error(const std::string& message) {
        return Status(ErrorCode::TRANSACTION_ERROR, message);
    }
    static Status lookup_error(const std::string& message) {
        return Status(ErrorCode::LOOKUP_ERROR, message);
    }
    static Status scan_error(const std::string& message) {
        return Status(ErrorCode::SCAN_ERROR, message);
    }

    bool ok() const { return code_ == ErrorCode::OK; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // 在消息前追加上下文, 错误码不变: "context: message"
    Status wrap(const std::string& context) const;

    // "LookupError: ..." 形式, 用于日志
    std::string to_string() const;

private:
    Status(ErrorCode code, const std::string& message) : code_(code), message_(message) {}

    ErrorCode code_ = ErrorCode::OK;
    std::string message_;
};

} // namespace db

#endif // DB_STATUS_H
