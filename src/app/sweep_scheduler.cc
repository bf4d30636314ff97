/**
 * @file sweep_scheduler.cc
 * @brief 失效清理定时调度实现
 * @details 职责：
 * 1. 计算距下一个本地清理时刻的间隔, 用单次 QTimer 等待 (避免夏令时导致固定 24h 周期漂移)。
 * 2. 到点后在 Qt 主线程执行 DisqualificationSweep, 再安排下一次。
 */

#include "app/sweep_scheduler.h"
#include "service/time_utils.h"
#include <QDebug>
#include <QDateTime>

SweepScheduler::SweepScheduler(int hour, int minute, QObject *parent)
    : QObject(parent), m_hour(hour), m_minute(minute) {
    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &SweepScheduler::onTimeout);
}

SweepScheduler::~SweepScheduler() {
    stop();
}

void SweepScheduler::start() {
    scheduleNext();
}

void SweepScheduler::stop() {
    m_timer->stop();
}

bool SweepScheduler::runNow() {
    service::SweepReport report;
    db::Status status = m_sweep.run(report);
    if (!status.ok()) {
        qWarning() << "Disqualification sweep failed:" << QString::fromStdString(status.to_string());
        emit sweepFinished(false, report.disqualified, report.clocked_out);
        return false;
    }

    qInfo() << "Disqualification sweep at"
            << QDateTime::fromSecsSinceEpoch(report.run_at).toString(Qt::ISODate)
            << "candidates:" << report.candidates
            << "disqualified:" << report.disqualified
            << "failed:" << report.failed
            << "clocked out:" << report.clocked_out;
    emit sweepFinished(true, report.disqualified, report.clocked_out);
    return true;
}

void SweepScheduler::onTimeout() {
    runNow();
    scheduleNext();
}

void SweepScheduler::scheduleNext() {
    int64_t waitSec = service::seconds_until_next(service::system_now(), m_hour, m_minute);
    m_timer->start(static_cast<int>(waitSec * 1000));
    qInfo() << "Next disqualification sweep in" << waitSec << "s";
}
