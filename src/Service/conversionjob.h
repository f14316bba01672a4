#ifndef CONVERSIONJOB_H
#define CONVERSIONJOB_H

#include <QObject>
#include <QSet>
#include <QSharedPointer>
#include <QVector>

#include "../Core/conversiontypes.h"
#include "../Core/coordinatorerror.h"
#include "../Core/coordinatorsettings.h"
#include "../Modules/Assembly/assemblyoutputparser.h"
#include "../Modules/Progress/progressaggregator.h"
#include "../Modules/Worker/watchdog.h"

class AssemblyCoordinator;
class AudioEnhancer;
class JobLogger;
class ProgressLineParser;
class SessionPreparer;
class WorkerSupervisor;

/// @brief 单个转换任务的控制器
/// @details 持有会话聚合根 ConversionSession 以及它的预处理、工作进程监管者、看门狗、
///          进度聚合与合成执行器。所有事件都在事件循环线程内处理，不需要加锁。
///          流程：预处理 -> 划分 -> 并行转换（失败重试、卡死终止）-> 合成 -> [音质增强] -> 完成。
///          音质增强只在配置启用且语音引擎匹配时运行，失败时以未增强的成品完成。
///          续传任务跳过预处理，没有缺失单元时直接合成。
class ConversionJob : public QObject
{
    Q_OBJECT
public:
    ConversionJob(const QString &jobId,
                  const ConversionConfig &config,
                  const CoordinatorSettings &settings,
                  const QSharedPointer<const ProgressLineParser> &parser,
                  JobLogger *logger,
                  QObject *parent = nullptr);
    ~ConversionJob() override;

    QString jobId() const;
    const ConversionSession &session() const;

    // 尚未发出 finished
    bool isActive() const;

    /// @brief 全新转换：先预处理会话，再划分并启动工作进程
    void startFresh();

    /// @brief 续传：使用由磁盘证据构造的会话
    void startResume(const ConversionSession &session);

    /// @brief 用户取消：结束全部子进程，立即以 Cancelled 结束任务
    void stop();

    /// @brief 最近一次发布的进度快照
    AggregatedProgress progress() const;

signals:
    void progressChanged(const QString &jobId, const AggregatedProgress &progress);
    void workerOutput(const QString &jobId, int workerId, const QString &line);
    void finished(const QString &jobId, const ConversionResult &result);

private slots:
    void onPreparationLog(const QString &line);
    void onPreparationFinished(bool success, const PrepInfo &info, const CoordinatorError &error);
    void onWorkerStarted(int workerId, qint64 pid);
    void onWorkerProgressed(int workerId);
    void onWorkerOutputLine(int workerId, const QString &line);
    void onWorkerExited(int workerId, const WorkerState &state);
    void onWatchdogCheck();
    void onAssemblyLog(const QString &line);
    void onAssemblyProgress(const AssemblyProgress &progress);
    void onAssemblyFinished(bool success, const QString &outputPath, const CoordinatorError &error);
    void onEnhancementProgress(int percent);
    void onEnhancementFinished(bool success, const QString &outputPath, const CoordinatorError &error);

private:
    bool buildFreshWorkers(QString *errorMessage);
    void launchWorkers();
    void scheduleRetry(WorkerSupervisor *supervisor);
    void syncWorkerStates();
    void checkAllWorkersDone();
    void startAssembly();
    void startEnhancement(const QString &outputPath);
    void publishEnhancing(int percent);
    void publishProgress();
    void publish(const AggregatedProgress &progress);
    void finishWith(bool success, const QString &outputPath, const CoordinatorError &error);
    int countWorkers(WorkerStatus status) const;
    int failedWorkerCount() const;
    WorkerSupervisor *supervisorFor(int workerId) const;

    ConversionSession m_session;
    CoordinatorSettings m_settings;
    QSharedPointer<const ProgressLineParser> m_parser;
    JobLogger *m_logger = nullptr;

    SessionPreparer *m_preparer = nullptr;
    QVector<WorkerSupervisor *> m_supervisors;
    AssemblyCoordinator *m_assembly = nullptr;
    AudioEnhancer *m_enhancer = nullptr;
    Watchdog m_watchdog;
    ProgressAggregator m_aggregator;

    QSet<int> m_pendingRetries;
    AggregatedProgress m_lastProgress;
    bool m_finished = false;
};

#endif // CONVERSIONJOB_H
