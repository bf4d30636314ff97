#include "database/db_status.h"

namespace db {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::TRANSACTION_ERROR: return "TransactionError";
        case ErrorCode::LOOKUP_ERROR: return "LookupError";
        case ErrorCode::SCAN_ERROR: return "ScanError";
    }
    return "UnknownError";
}

Status Status::wrap(const std::string& context) const {
    if (ok()) return *this;
    return Status(code_, context + ": " + message_);
}

std::string Status::to_string() const {
    if (ok()) return "OK";
    return std::string(error_code_name(code_)) + ": " + message_;
}

} // namespace db
