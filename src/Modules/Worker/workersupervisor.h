#ifndef WORKERSUPERVISOR_H
#define WORKERSUPERVISOR_H

#include <QObject>
#include <QProcess>

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorsettings.h"

class ProgressLineParser;

/// @brief 工作进程启动参数（同一会话内所有工作进程共用）
struct WorkerLaunchContext
{
    EngineLaunchSettings launch;
    QString sessionId;
    QString outputDir;
    EngineSettings engine;
    bool resumeRun = false;
};

/// @brief 单个工作进程的监管者
/// @details 持有一个引擎进程，负责启动、逐行解析进度、退出判定、重试、取消与卡死终止。
///          状态机：Pending -> Running -> {Complete, Error}；Error 可经 retry() 回到 Running。
///          每次尝试使用新的 QProcess，旧进程对象延迟释放。
class WorkerSupervisor : public QObject
{
    Q_OBJECT
public:
    WorkerSupervisor(int workerId,
                     const WorkerAssignment &assignment,
                     const WorkerLaunchContext &context,
                     const ProgressLineParser *parser,
                     QObject *parent = nullptr);
    ~WorkerSupervisor() override;

    int workerId() const;
    const WorkerState &state() const;
    bool isRunning() const;

    /// @brief 合并输出的尾部（用于错误详情）
    QString outputTail() const;

    /// @brief 启动当前任务
    /// @return 进程启动失败时返回 false（同时发出 exited）
    bool start();

    // 是否仍可重试：失败原因不是取消，且重试次数未用尽
    bool canRetry(int maxRetries) const;

    /// @brief 以原任务范围重新启动，retryCount 加 1
    bool retry();

    /// @brief 用户取消：强制结束进程树，之后不再重试
    void cancel();

    /// @brief 看门狗判定卡死后强制结束进程树，退出后按 Stalled 处理
    void terminateForStall(const QString &reason);

    void markPermanentlyFailed();

signals:
    void started(int workerId, qint64 pid);
    void progressed(int workerId);
    void outputLine(int workerId, const QString &line);
    void exited(int workerId, const WorkerState &state);

private slots:
    void onProcessStarted();
    void onReadyReadOutput();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessErrorOccurred(QProcess::ProcessError error);

private:
    void resetAttemptCounters();
    void processOutputLine(const QString &line);
    void killProcessTree();
    void reportExit();
    QProcess *createProcess();

    WorkerState m_state;
    WorkerLaunchContext m_context;
    const ProgressLineParser *m_parser = nullptr;
    QProcess *m_process = nullptr;

    QString m_stdoutBuffer;
    QString m_outputTail;
    QString m_stallReason;
    bool m_cancelRequested = false;
    bool m_stallKillRequested = false;
    bool m_sawRecoveryMarker = false;
    bool m_exitReported = false;
};

#endif // WORKERSUPERVISOR_H
