#include "processtreekiller.h"

#include <QHash>
#include <QProcess>
#include <QRegularExpression>

QList<qint64> ProcessTreeKiller::collectDescendants(qint64 pid)
{
    QList<qint64> descendants;
    if (pid <= 0) {
        return descendants;
    }

    QProcess wmic;
    wmic.setProcessChannelMode(QProcess::MergedChannels);
    wmic.start(QStringLiteral("wmic"),
               QStringList() << "process" << "get" << "ParentProcessId,ProcessId" << "/format:csv");
    if (!wmic.waitForStarted(2000) || !wmic.waitForFinished(5000)) {
        wmic.kill();
        return descendants;
    }

    QHash<qint64, QList<qint64>> children;
    static const QRegularExpression rowRegex(QStringLiteral(",(\\d+),(\\d+)\\s*$"));
    const QStringList lines = QString::fromLocal8Bit(wmic.readAll()).split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QRegularExpressionMatch match = rowRegex.match(line);
        if (match.hasMatch()) {
            children[match.captured(1).toLongLong()].append(match.captured(2).toLongLong());
        }
    }

    QList<qint64> queue = children.value(pid);
    while (!queue.isEmpty()) {
        const qint64 current = queue.takeFirst();
        if (descendants.contains(current)) {
            continue;
        }
        descendants.append(current);
        queue.append(children.value(current));
    }
    return descendants;
}

bool ProcessTreeKiller::terminateProcessTree(qint64 pid, QString *errorMessage)
{
    if (pid <= 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("无效的进程号：%1").arg(pid);
        }
        return false;
    }

    const int exitCode = QProcess::execute(QStringLiteral("taskkill"),
                                           QStringList() << "/F" << "/T" << "/PID" << QString::number(pid));
    // 128：进程不存在
    if (exitCode != 0 && exitCode != 128) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("taskkill 执行失败，退出码：%1").arg(exitCode);
        }
        return false;
    }
    return true;
}
