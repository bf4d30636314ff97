#ifndef ENTRY_DAO_H
#define ENTRY_DAO_H

#include "database/database_types.h"
#include "database/db_status.h"
#include <vector>

namespace db {

class EntryDao {
public:
    // 追加一条工时记录, 返回生成的 eid
    Status add_entry(const Entry& entry, int64_t& new_eid);

    Status get_entry(int64_t eid, Entry& out);

    // 管理员修正: 不校验 from/to 的先后
    Status update_range(int64_t eid, std::time_t from, std::time_t to);

    Status delete_entry(int64_t eid);

    // 用户全部记录, 按 from 升序; 非法行记录日志后跳过
    Status get_entries_by_user(int64_t uid, std::vector<Entry>& out);

    // 完全落在窗口内的有效记录: from > start 且 to < end
    Status get_valid_entries_within(int64_t uid, std::time_t start, std::time_t end, std::vector<Entry>& out);
};

} // namespace db

#endif // ENTRY_DAO_H
