#ifndef WATCHDOG_H
#define WATCHDOG_H

#include <QObject>
#include <QTimer>
#include <QVector>

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorsettings.h"

/// @brief 卡死判定结果
struct StalledWorker
{
    enum class Kind
    {
        Startup,
        Progress
    };

    int workerId = 0;
    Kind kind = Kind::Startup;
    qint64 silentForMs = 0;

    QString reason() const;
};

/// @brief 工作进程看门狗
/// @details 固定周期检查运行中的工作进程：
///          启动后从未输出进度且超过 startupTimeoutMs 视为启动卡死；
///          已有进度但超过 progressTimeoutMs 未更新视为运行卡死。
///          判定逻辑为纯函数 findStalledWorkers，定时器只负责按周期调用。
class Watchdog : public QObject
{
    Q_OBJECT
public:
    explicit Watchdog(const WatchdogTimeouts &timeouts, QObject *parent = nullptr);

    void start();
    void stop();
    bool isActive() const;

    static QVector<StalledWorker> findStalledWorkers(const QVector<WorkerState> &workers,
                                                     qint64 nowMs,
                                                     const WatchdogTimeouts &timeouts);

signals:
    // 每个周期触发一次，由会话提供当前工作进程快照后调用 findStalledWorkers
    void checkRequested();

private:
    WatchdogTimeouts m_timeouts;
    QTimer m_timer;
};

#endif // WATCHDOG_H
