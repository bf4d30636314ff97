/**
 * @file sweep_scheduler.h
 * @brief 失效清理定时调度
 * @details 每天在本地 SWEEP_HOUR:SWEEP_MINUTE 触发一次 DisqualificationSweep。
 */

#ifndef SWEEP_SCHEDULER_H
#define SWEEP_SCHEDULER_H

#include <QObject>
#include <QTimer>
#include "service/disqualification_sweep.h"

class SweepScheduler : public QObject {
    Q_OBJECT
public:
    SweepScheduler(int hour, int minute, QObject *parent = nullptr);
    ~SweepScheduler();

    // 按下一次触发时刻启动单次定时器
    void start();
    void stop();

    // 立即执行一次 (不影响已安排的下一次)
    bool runNow();

signals:
    // 每次清理结束后发出
    void sweepFinished(bool ok, int disqualified, int clockedOut);

private slots:
    void onTimeout();

private:
    void scheduleNext();

    int m_hour;
    int m_minute;
    QTimer *m_timer;
    service::DisqualificationSweep m_sweep;
};

#endif // SWEEP_SCHEDULER_H
