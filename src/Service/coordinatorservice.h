#ifndef COORDINATORSERVICE_H
#define COORDINATORSERVICE_H

#include <QHash>
#include <QObject>
#include <QSharedPointer>
#include <QStringList>

#include "../Core/conversiontypes.h"
#include "../Core/coordinatorerror.h"
#include "../Core/coordinatorsettings.h"

class ConversionJob;
class JobLogger;
class ProgressLineParser;
class SessionPreparer;

/// @brief 转换协调服务
/// @details 调用方的唯一入口。持有活动任务表（jobId -> ConversionJob）、任务日志与进度解析器；
///          任务结束后自动从表中移除。进度与结果通过信号推送。
class CoordinatorService : public QObject
{
    Q_OBJECT
public:
    explicit CoordinatorService(const CoordinatorSettings &settings, QObject *parent = nullptr);
    ~CoordinatorService() override;

    const CoordinatorSettings &settings() const;
    JobLogger *logger() const;

    /// @brief 替换引擎进度行解析器（只影响之后启动的任务，运行中的任务继续持有旧解析器）
    void setProgressLineParser(const QSharedPointer<const ProgressLineParser> &parser);

    /// @brief 单独预处理会话（异步，结果通过 sessionPrepared 发出）
    /// @return 预处理进程已在运行时返回 false
    bool prepareSession(const QString &documentPath, const EngineSettings &engine);

    /// @brief 启动全新转换
    /// @param jobId 调用方给定的任务号，必须唯一
    /// @param config 转换配置
    /// @param errorMessage 参数无效或任务号重复时的原因
    bool startConversion(const QString &jobId, const ConversionConfig &config, QString *errorMessage = nullptr);

    /// @brief 取消任务
    /// @return 任务不存在时返回 false
    bool stopConversion(const QString &jobId);

    /// @brief 读取任务当前进度
    bool progress(const QString &jobId, AggregatedProgress *progress) const;

    /// @brief 检查文档的续传状态
    ResumeCheckResult checkResumeStatus(const QString &documentPath, const QString &sessionId = QString()) const;

    // 会话根目录下所有可续传的会话
    QVector<ResumeCheckResult> listResumableSessions() const;

    /// @brief 续传转换
    /// @param evidence checkResumeStatus 的结果；缺少关键字段时会重新读取磁盘
    bool resumeConversion(const QString &jobId,
                          const ConversionConfig &config,
                          const ResumeCheckResult &evidence,
                          QString *errorMessage = nullptr);

    bool isConversionActive(const QString &jobId) const;
    QStringList activeJobs() const;

    // 应用退出前取消全部任务
    void stopAll();

signals:
    void sessionPrepared(bool success, const PrepInfo &info, const CoordinatorError &error);
    void progressChanged(const QString &jobId, const AggregatedProgress &progress);
    void workerOutput(const QString &jobId, int workerId, const QString &line);
    void conversionFinished(const QString &jobId, const ConversionResult &result);
    void logLine(const QString &line);

private slots:
    void onJobFinished(const QString &jobId, const ConversionResult &result);

private:
    bool validateConfig(const QString &jobId, const ConversionConfig &config, bool requireDocument,
                        QString *errorMessage) const;
    void registerJob(ConversionJob *job);

    CoordinatorSettings m_settings;
    JobLogger *m_logger = nullptr;
    SessionPreparer *m_preparer = nullptr;
    QSharedPointer<const ProgressLineParser> m_parser;
    QHash<QString, ConversionJob *> m_jobs;
};

#endif // COORDINATORSERVICE_H
