/**
 * @file disqualification_sweep.cc
 * @brief 失效清理实现
 * @details 整次清理使用同一个 now: 失效记录的 to 与签退后的 since 相同。
 *          批量签退只作用于 since <= now 的用户, 清理开始之后才签到的用户不受影响。
 */

#include "service/disqualification_sweep.h"
#include "database/entry_dao.h"
#include "database/user_state_dao.h"
#include <iostream>
#include <utility>
#include <vector>

namespace service {

DisqualificationSweep::DisqualificationSweep(NowFn now) : now_(std::move(now)) {}

db::Status DisqualificationSweep::run(SweepReport& report) {
    report = SweepReport();
    report.run_at = now_();

    db::UserStateDao state_dao;
    std::vector<db::UserState> clocked_in;
    db::Status status = state_dao.list_clocked_in(clocked_in);
    if (!status.ok()) {
        status = status.wrap("failed to select users to disqualify");
        std::cerr << status.to_string() << std::endl;
        return status;
    }

    db::EntryDao entry_dao;
    for (const auto& user : clocked_in) {
        // 清理开始之后才签到的会话留给下一次
        if (user.since > report.run_at) {
            continue;
        }
        ++report.candidates;

        db::Entry entry;
        entry.uid = user.uid;
        entry.from = user.since;
        entry.to = report.run_at;
        entry.valid = false;

        int64_t eid = -1;
        db::Status insert_status = entry_dao.add_entry(entry, eid);
        if (!insert_status.ok()) {
            std::cerr << insert_status.wrap("failed to add disqualifying entry for " + std::to_string(user.uid)).to_string()
                      << std::endl;
            ++report.failed;
            continue;
        }
        ++report.disqualified;
    }

    // 无论前面是否有失败, 批量签退照常执行
    status = state_dao.clock_out_all(report.run_at, report.run_at, report.clocked_out);
    if (!status.ok()) {
        status = status.wrap("failed to clock out disqualified users");
        std::cerr << status.to_string() << std::endl;
        return status;
    }

    std::cout << "Disqualification sweep: " << report.disqualified << "/" << report.candidates
              << " sessions disqualified, " << report.clocked_out << " users clocked out" << std::endl;
    return db::Status::ok_status();
}

} // namespace service
