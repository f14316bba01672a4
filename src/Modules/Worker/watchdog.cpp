#include "watchdog.h"

QString StalledWorker::reason() const
{
    const qint64 minutes = silentForMs / 60000;
    if (kind == Kind::Startup) {
        return QStringLiteral("no progress since start (%1 min)").arg(minutes);
    }
    return QStringLiteral("no progress update for %1 min").arg(minutes);
}

Watchdog::Watchdog(const WatchdogTimeouts &timeouts, QObject *parent)
    : QObject(parent)
    , m_timeouts(timeouts)
{
    m_timer.setInterval(m_timeouts.intervalMs);
    connect(&m_timer, &QTimer::timeout, this, &Watchdog::checkRequested);
}

void Watchdog::start()
{
    m_timer.start();
}

void Watchdog::stop()
{
    m_timer.stop();
}

bool Watchdog::isActive() const
{
    return m_timer.isActive();
}

QVector<StalledWorker> Watchdog::findStalledWorkers(const QVector<WorkerState> &workers,
                                                    qint64 nowMs,
                                                    const WatchdogTimeouts &timeouts)
{
    QVector<StalledWorker> stalled;

    for (const WorkerState &worker : workers) {
        if (worker.status != WorkerStatus::Running) {
            continue;
        }

        if (!worker.hasShownProgress) {
            const qint64 silentFor = nowMs - worker.startedAtMs;
            if (silentFor > timeouts.startupTimeoutMs) {
                StalledWorker hit;
                hit.workerId = worker.id;
                hit.kind = StalledWorker::Kind::Startup;
                hit.silentForMs = silentFor;
                stalled.append(hit);
            }
            continue;
        }

        const qint64 silentFor = nowMs - worker.lastProgressAtMs;
        if (silentFor > timeouts.progressTimeoutMs) {
            StalledWorker hit;
            hit.workerId = worker.id;
            hit.kind = StalledWorker::Kind::Progress;
            hit.silentForMs = silentFor;
            stalled.append(hit);
        }
    }

    return stalled;
}
