#include "etaestimator.h"

#include <QtMath>

EtaEstimator::EtaEstimator(const EtaTuning &tuning)
    : m_tuning(tuning)
{
}

void EtaEstimator::reset()
{
    m_samples.clear();
}

EtaEstimator::Estimate EtaEstimator::update(qint64 nowMs, int doneInSession, int remainingUnits, qint64 workStartMs)
{
    m_samples.append(qMakePair(nowMs, doneInSession));

    const qint64 windowStart = nowMs - m_tuning.windowMs;
    while (!m_samples.isEmpty() && m_samples.first().first < windowStart) {
        m_samples.removeFirst();
    }

    Estimate estimate;
    if (workStartMs <= 0 || doneInSession <= 1) {
        return estimate;
    }

    const qint64 workElapsedMs = nowMs - workStartMs;
    if (workElapsedMs < m_tuning.minElapsedMs || workElapsedMs <= 0) {
        return estimate;
    }

    const double workSeconds = static_cast<double>(workElapsedMs) / 1000.0;
    const double workRate = doneInSession / workSeconds;
    double rate = workRate;

    if (m_samples.size() >= m_tuning.minSamples) {
        const QPair<qint64, int> &oldest = m_samples.first();
        const int unitsInWindow = doneInSession - oldest.second;
        const qint64 windowSpanMs = nowMs - oldest.first;
        if (unitsInWindow > 0 && windowSpanMs > m_tuning.minWindowSpanMs) {
            const double windowRate = unitsInWindow / (static_cast<double>(windowSpanMs) / 1000.0);
            rate = workRate * m_tuning.longHorizonWeight + windowRate * (1.0 - m_tuning.longHorizonWeight);
        }
    }

    estimate.unitsPerMinute = workRate * 60.0;
    if (rate > 0.0) {
        estimate.remainingSeconds = qRound(qMax(0, remainingUnits) / rate);
    }
    return estimate;
}

int EtaEstimator::sampleCount() const
{
    return m_samples.size();
}
