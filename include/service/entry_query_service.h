/**
 * @file entry_query_service.h
 * @brief 按日分组查询工时记录
 */

#ifndef ENTRY_QUERY_SERVICE_H
#define ENTRY_QUERY_SERVICE_H

#include "database/database_types.h"
#include "database/db_status.h"
#include <map>
#include <vector>

namespace service {

// key: 本地当天零点 (Unix 秒); value: 当天开始的记录, 按 from 升序
using EntriesByDay = std::map<std::time_t, std::vector<db::Entry>>;

class EntryQueryService {
public:
    /**
     * @brief 列出用户全部记录 (含失效记录), 按 from 所在的本地日期分组
     * 跨午夜的记录整体归入开始那一天
     */
    db::Status list_entries(int64_t uid, EntriesByDay& days);
};

} // namespace service

#endif // ENTRY_QUERY_SERVICE_H
