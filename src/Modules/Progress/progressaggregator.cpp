#include "progressaggregator.h"

#include <QtMath>

ProgressAggregator::ProgressAggregator(const EtaTuning &tuning)
    : m_estimator(tuning)
{
}

int ProgressAggregator::completedInSession(const ConversionSession &session)
{
    int sum = 0;
    for (const WorkerState &worker : session.workers) {
        sum += session.isResume ? worker.actualConversions : worker.completedUnits;
    }
    return sum;
}

int ProgressAggregator::completedUnits(const ConversionSession &session)
{
    const int inSession = completedInSession(session);
    const int completed = session.isResume ? session.baselineCompleted + inSession : inSession;
    return qMin(completed, session.prepInfo.totalUnits);
}

void ProgressAggregator::reset()
{
    m_estimator.reset();
}

AggregatedProgress ProgressAggregator::aggregate(ConversionSession &session, qint64 nowMs)
{
    AggregatedProgress progress;
    progress.phase = session.phase;
    progress.totalUnits = session.prepInfo.totalUnits;
    progress.completedInSession = completedInSession(session);
    progress.completedUnits = completedUnits(session);
    progress.workers = session.workers;

    for (const WorkerState &worker : session.workers) {
        if (worker.status == WorkerStatus::Running) {
            ++progress.activeWorkers;
        }
    }

    if (progress.totalUnits > 0) {
        progress.percentage = qMin(100, qRound(progress.completedUnits * 100.0 / progress.totalUnits));
    }

    if (progress.completedInSession > 0 && session.firstUnitCompletedAtMs == 0) {
        session.firstUnitCompletedAtMs = nowMs;
    }

    const int remaining = qMax(0, progress.totalUnits - progress.completedUnits);
    const EtaEstimator::Estimate estimate = m_estimator.update(nowMs,
                                                               progress.completedInSession,
                                                               remaining,
                                                               session.firstUnitCompletedAtMs);
    progress.estimatedRemainingSeconds = estimate.remainingSeconds;

    QString rateDisplay;
    if (estimate.hasRate()) {
        rateDisplay = QStringLiteral(" (%1/min)").arg(estimate.unitsPerMinute, 0, 'f', 1);
    }

    progress.message = session.isResume
                           ? QStringLiteral("Resuming: %1 new%2").arg(progress.completedInSession).arg(rateDisplay)
                           : QStringLiteral("%1 workers%2").arg(progress.activeWorkers).arg(rateDisplay);
    return progress;
}
