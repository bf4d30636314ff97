/**
 * @file entry_query_service.cc
 * @brief 按日分组查询实现
 */

#include "service/entry_query_service.h"
#include "database/entry_dao.h"
#include "service/time_utils.h"

namespace service {

db::Status EntryQueryService::list_entries(int64_t uid, EntriesByDay& days) {
    days.clear();

    db::EntryDao dao;
    std::vector<db::Entry> entries;
    db::Status status = dao.get_entries_by_user(uid, entries);
    if (!status.ok()) {
        return status;
    }

    for (const auto& e : entries) {
        days[start_of_day(e.from)].push_back(e);
    }
    return db::Status::ok_status();
}

} // namespace service
