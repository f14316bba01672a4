#ifndef PROCESSTREEKILLER_H
#define PROCESSTREEKILLER_H

#include <QList>
#include <QString>

/// @brief 进程树强制终止
/// @details 引擎通常经由 conda run / shell 包装启动，真正的工作进程是子孙进程，
///          只结束直接子进程会留下孤儿。各平台实现分别位于
///          processtreekiller_unix.cpp 与 processtreekiller_win.cpp。
class ProcessTreeKiller
{
public:
    /// @brief 强制终止 pid 及其全部子孙进程
    /// @param pid 根进程号（<= 0 时直接返回 false）
    /// @param errorMessage 失败原因
    /// @return 根进程已被终止或本就不存在时返回 true
    static bool terminateProcessTree(qint64 pid, QString *errorMessage = nullptr);

    /// @brief 收集 pid 的全部子孙进程（广度优先，父进程在前）
    static QList<qint64> collectDescendants(qint64 pid);
};

#endif // PROCESSTREEKILLER_H
