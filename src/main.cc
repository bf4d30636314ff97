#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <string>
#include <vector>
#include <iostream>
#include <cstdlib>
#include "config.h"
#include "database/database_manager.h"
#include "app/sweep_scheduler.h"

/**
 * 用法: timeclockd [db_path] [sweep_hour sweep_minute] [--sweep-now]
 */
int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // 数据库路径 (相对于可执行文件目录)
    QString appDir = QCoreApplication::applicationDirPath();
    std::string db_path = (appDir + "/" + QString::fromStdString(Config::Path::DATABASE)).toStdString();
    int sweep_hour = Config::Default::SWEEP_HOUR;
    int sweep_minute = Config::Default::SWEEP_MINUTE;
    bool sweep_now = false;

    // 命令行参数解析
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--sweep-now") {
            sweep_now = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() >= 1) {
        db_path = positional[0];
    }
    if (positional.size() >= 3) {
        sweep_hour = std::atoi(positional[1].c_str());
        sweep_minute = std::atoi(positional[2].c_str());
        if (sweep_hour < 0 || sweep_hour > 23 || sweep_minute < 0 || sweep_minute > 59) {
            std::cerr << "Invalid sweep time: " << positional[1] << ":" << positional[2] << std::endl;
            return 1;
        }
    }

    // 确保数据库目录存在
    QDir dbDir = QFileInfo(QString::fromStdString(db_path)).dir();
    if (!dbDir.exists()) {
        dbDir.mkpath(".");
        std::cout << "Created database directory: " << dbDir.absolutePath().toStdString() << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Database: " << db_path << std::endl;
    std::cout << "  Sweep time: " << sweep_hour << ":" << (sweep_minute < 10 ? "0" : "") << sweep_minute << std::endl;
    std::cout << "========================================" << std::endl;

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return -1;
    }

    SweepScheduler scheduler(sweep_hour, sweep_minute);
    if (sweep_now && !scheduler.runNow()) {
        std::cerr << "Initial disqualification sweep failed" << std::endl;
    }
    scheduler.start();

    int rc = app.exec();
    db::DatabaseManager::instance().close();
    return rc;
}
