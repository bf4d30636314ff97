#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdio>
#include <cerrno>
#include "database/database_manager.h"
#include "database/user_state_dao.h"
#include "service/attendance_service.h"
#include "service/balance_calculator.h"
#include "service/disqualification_sweep.h"
#include "service/entry_query_service.h"
#include "service/status_service.h"
#include "service/time_utils.h"

void print_usage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "  timeclock_tool init <db_path>" << std::endl;
    std::cout << "  timeclock_tool add_user <db_path> <uid>" << std::endl;
    std::cout << "  timeclock_tool list_users <db_path>" << std::endl;
    std::cout << "  timeclock_tool clock_in <db_path> <uid>" << std::endl;
    std::cout << "  timeclock_tool clock_out <db_path> <uid>" << std::endl;
    std::cout << "  timeclock_tool status <db_path> <uid>" << std::endl;
    std::cout << "  timeclock_tool list <db_path> <uid>" << std::endl;
    std::cout << "  timeclock_tool delta_day <db_path> <uid> <YYYY-MM-DD>" << std::endl;
    std::cout << "  timeclock_tool delta_month <db_path> <uid> <YYYY-MM-DD>" << std::endl;
    std::cout << "  timeclock_tool edit <db_path> <eid> <from_unix_s> <to_unix_s>" << std::endl;
    std::cout << "  timeclock_tool delete <db_path> <eid>" << std::endl;
    std::cout << "  timeclock_tool sweep <db_path>" << std::endl;
}

// 返回 false 表示参数不是整数或超出范围
bool parse_int64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    out = static_cast<int64_t>(v);
    return true;
}

// "+1h02m03s" / "-0h30m00s"
std::string format_delta(int64_t delta) {
    int64_t abs_delta = delta < 0 ? -delta : delta;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%c%lldh%02lldm%02llds", delta < 0 ? '-' : '+',
                  static_cast<long long>(abs_delta / 3600),
                  static_cast<long long>((abs_delta % 3600) / 60),
                  static_cast<long long>(abs_delta % 60));
    return buf;
}

int report(const db::Status& status) {
    if (!status.ok()) {
        std::cerr << status.to_string() << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::string db_path = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);

    // 各命令所需参数个数
    size_t needed = 0;
    if (command == "add_user" || command == "clock_in" || command == "clock_out" ||
        command == "status" || command == "list" || command == "delete") {
        needed = 1;
    } else if (command == "delta_day" || command == "delta_month") {
        needed = 2;
    } else if (command == "edit") {
        needed = 3;
    } else if (command != "init" && command != "list_users" && command != "sweep") {
        print_usage();
        return 1;
    }
    if (args.size() < needed) {
        print_usage();
        return 1;
    }

    int64_t id = -1;
    if (needed >= 1 && !parse_int64(args[0], id)) {
        std::cerr << "Invalid id: " << args[0] << std::endl;
        return 1;
    }

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return 1;
    }

    service::AttendanceService attendance;

    if (command == "init") {
        std::cout << "Database initialized successfully at " << db_path << std::endl;
    }
    else if (command == "add_user") {
        db::Status status = attendance.provision_user(id);
        if (status.ok()) {
            std::cout << "User added. UID: " << id << std::endl;
        }
        return report(status);
    }
    else if (command == "list_users") {
        db::UserStateDao dao;
        std::vector<db::UserState> users;
        db::Status status = dao.list_all(users);
        std::cout << "UID\tState\tSince" << std::endl;
        for (const auto& u : users) {
            std::cout << u.uid << "\t" << db::clock_state_code(u.state) << "\t"
                      << service::format_local(u.since) << std::endl;
        }
        return report(status);
    }
    else if (command == "clock_in") {
        return report(attendance.clock_in(id));
    }
    else if (command == "clock_out") {
        return report(attendance.clock_out(id));
    }
    else if (command == "status") {
        service::StatusService status_service;
        service::UserStatus st;
        db::Status status = status_service.get_status(id, st);
        if (status.ok()) {
            std::cout << "UID: " << st.uid << std::endl;
            std::cout << "State: " << (st.state == db::ClockState::In ? "in" : "out")
                      << " since " << service::format_local(st.since) << std::endl;
            std::cout << "Today: " << format_delta(st.day_delta) << std::endl;
            std::cout << "Month: " << format_delta(st.month_delta) << std::endl;
        }
        return report(status);
    }
    else if (command == "list") {
        service::EntryQueryService query;
        service::EntriesByDay days;
        db::Status status = query.list_entries(id, days);
        for (const auto& day : days) {
            std::cout << service::format_local(day.first).substr(0, 10) << std::endl;
            for (const auto& e : day.second) {
                std::cout << "  #" << e.eid << "\t" << service::format_local(e.from)
                          << " -> " << service::format_local(e.to)
                          << (e.valid ? "" : "\t(disqualified)") << std::endl;
            }
        }
        return report(status);
    }
    else if (command == "delta_day" || command == "delta_month") {
        std::time_t date;
        if (!service::parse_date(args[1], date)) {
            std::cerr << "Invalid date: " << args[1] << std::endl;
            return 1;
        }
        service::BalanceCalculator balance;
        int64_t delta = 0;
        db::Status status = command == "delta_day"
            ? balance.get_delta_for_day(id, date, delta)
            : balance.get_delta_for_month(id, date, delta);
        if (status.ok()) {
            std::cout << delta << "\t" << format_delta(delta) << std::endl;
        }
        return report(status);
    }
    else if (command == "edit") {
        int64_t from = 0, to = 0;
        if (!parse_int64(args[1], from) || !parse_int64(args[2], to)) {
            std::cerr << "Invalid timestamps" << std::endl;
            return 1;
        }
        return report(attendance.edit_entry(id, static_cast<std::time_t>(from), static_cast<std::time_t>(to)));
    }
    else if (command == "delete") {
        return report(attendance.delete_entry(id));
    }
    else if (command == "sweep") {
        service::DisqualificationSweep sweep;
        service::SweepReport sweep_report;
        return report(sweep.run(sweep_report));
    }

    return 0;
}
