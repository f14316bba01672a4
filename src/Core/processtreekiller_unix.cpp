#include "processtreekiller.h"

#include <QDir>
#include <QFile>
#include <QHash>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>

namespace {

// 从 /proc/<pid>/stat 解析父进程号；comm 字段可能包含空格与括号，需从最后一个 ')' 之后解析
qint64 readParentPid(const QString &statPath)
{
    QFile file(statPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return -1;
    }

    const QByteArray content = file.readAll();
    const int commEnd = content.lastIndexOf(')');
    if (commEnd < 0) {
        return -1;
    }

    const QList<QByteArray> fields = content.mid(commEnd + 1).simplified().split(' ');
    // fields[0] 为进程状态，fields[1] 为 ppid
    if (fields.size() < 2) {
        return -1;
    }

    bool ok = false;
    const qint64 ppid = fields.at(1).toLongLong(&ok);
    return ok ? ppid : -1;
}

QHash<qint64, QList<qint64>> buildChildrenMap()
{
    QHash<qint64, QList<qint64>> children;

    const QDir procDir(QStringLiteral("/proc"));
    const QStringList entries = procDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &entry : entries) {
        bool ok = false;
        const qint64 pid = entry.toLongLong(&ok);
        if (!ok) {
            continue;
        }

        const qint64 ppid = readParentPid(procDir.filePath(entry + QStringLiteral("/stat")));
        if (ppid > 0) {
            children[ppid].append(pid);
        }
    }

    return children;
}

} // namespace

QList<qint64> ProcessTreeKiller::collectDescendants(qint64 pid)
{
    QList<qint64> descendants;
    if (pid <= 0) {
        return descendants;
    }

    const QHash<qint64, QList<qint64>> children = buildChildrenMap();
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

    // 先停住根进程，防止在收集期间继续派生子进程
    ::kill(static_cast<pid_t>(pid), SIGSTOP);

    const QList<qint64> descendants = collectDescendants(pid);
    for (int i = descendants.size() - 1; i >= 0; --i) {
        ::kill(static_cast<pid_t>(descendants.at(i)), SIGKILL);
    }

    if (::kill(static_cast<pid_t>(pid), SIGKILL) != 0 && errno != ESRCH) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("终止进程 %1 失败：%2").arg(pid).arg(QString::fromLocal8Bit(std::strerror(errno)));
        }
        return false;
    }

    return true;
}
