#ifndef TESTSUPPORT_H
#define TESTSUPPORT_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <ostream>

#include "Core/coordinatorsettings.h"

// 断言失败时以文本形式输出 QString
inline void PrintTo(const QString &value, std::ostream *os)
{
    *os << '"' << value.toStdString() << '"';
}

namespace testsupport {

/// @brief 假引擎脚本的行为参数
struct FakeEngineOptions
{
    // 会话固定两章，各占一半单元
    int totalUnits = 8;
    int prepExitCode = 0;
    int assembleExitCode = 0;
    bool assembleWritesOutput = true;

    // 以该起始单元开始的工作进程前 failTimes 次运行失败（-1 表示不启用）
    int failStart = -1;
    int failTimes = 0;

    // 以该起始单元开始的工作进程前 hangTimes 次运行不输出并挂起（-1 表示不启用）
    int hangStart = -1;
    int hangTimes = 0;

    // 每个单元之间的停顿（秒，0 表示不停顿）
    QString unitDelay = QStringLiteral("0");
};

/// @brief 把假引擎写成 /bin/sh 脚本
/// @return 脚本路径
QString writeFakeEngine(const QString &dir, const QString &sessionsRoot, const FakeEngineOptions &options);

/// @brief 写一个可执行的假标签工具：把参数逐行追加到 argsLogPath
/// @param sleepSeconds 大于 0 时记录参数后挂起这么久
QString writeFakeTagger(const QString &dir, const QString &argsLogPath, int exitCode = 0, int sleepSeconds = 0);

/// @brief 写一个可执行的假音质增强程序：向最后一个参数指向的文件追加 "enhanced"
/// @param exitCode 非 0 时不改写文件并以该退出码失败
QString writeFakeEnhancer(const QString &dir, int exitCode = 0);

/// @brief 指向假引擎的协调器配置（短超时）
CoordinatorSettings fakeEngineSettings(const QString &scriptPath, const QString &sessionsRoot, const QString &logsDir);

// 在事件循环中等待条件成立
bool waitUntil(const std::function<bool()> &condition, int timeoutMs = 10000);

bool writeTextFile(const QString &path, const QByteArray &content);

// 修改文件的修改时间
bool setModificationTime(const QString &path, const QDateTime &time);

/// @brief 手工构造一个会话目录
/// @param completedIndices 已存在的 <index>.flac
/// @return ebook-<id> 目录
QString createSession(const QString &sessionsRoot,
                      const QString &sessionId,
                      const QString &documentPath,
                      int totalUnits,
                      const QVector<int> &completedIndices,
                      const QJsonObject &extraState = QJsonObject());

// 会话的句子输出目录
QString sentencesDirFor(const QString &sessionsRoot, const QString &sessionId);

} // namespace testsupport

#endif // TESTSUPPORT_H
