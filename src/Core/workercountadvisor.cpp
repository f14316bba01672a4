#include "workercountadvisor.h"

#include <QFile>
#include <QRegularExpression>
#include <QtMath>

WorkerCountRecommendation WorkerCountAdvisor::recommend(qint64 availableBytes)
{
    WorkerCountRecommendation recommendation;
    recommendation.availableBytes = availableBytes;

    if (availableBytes < 0) {
        recommendation.count = 1;
        recommendation.reason = QStringLiteral("available memory unknown");
        return recommendation;
    }

    const int byMemory = static_cast<int>(availableBytes / kBytesPerWorker);
    recommendation.count = qMin(kMaxRecommendedWorkers, qMax(1, byMemory));

    const double availableGb = static_cast<double>(availableBytes) / (1024.0 * 1024.0 * 1024.0);
    recommendation.reason = QStringLiteral("%1GB RAM available").arg(qRound(availableGb));
    return recommendation;
}

WorkerCountRecommendation WorkerCountAdvisor::recommendForThisMachine()
{
    return recommend(availableMemoryBytes());
}

qint64 WorkerCountAdvisor::availableMemoryBytes()
{
    QFile meminfo(QStringLiteral("/proc/meminfo"));
    if (!meminfo.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return -1;
    }

    const QString content = QString::fromLatin1(meminfo.readAll());

    // 旧内核没有 MemAvailable，退回 MemFree
    static const QRegularExpression availableRegex(QStringLiteral("^MemAvailable:\\s+(\\d+)\\s*kB"),
                                                   QRegularExpression::MultilineOption);
    static const QRegularExpression freeRegex(QStringLiteral("^MemFree:\\s+(\\d+)\\s*kB"),
                                              QRegularExpression::MultilineOption);

    QRegularExpressionMatch match = availableRegex.match(content);
    if (!match.hasMatch()) {
        match = freeRegex.match(content);
    }
    if (!match.hasMatch()) {
        return -1;
    }

    return match.captured(1).toLongLong() * 1024;
}
