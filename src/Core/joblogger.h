#ifndef JOBLOGGER_H
#define JOBLOGGER_H

#include <QDate>
#include <QDateTime>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include "coordinatorerror.h"

/// @brief 转换任务日志
/// @details 每天一个 JSON Lines 日志文件（audiobook-YYYY-MM-DD.log），
///          另维护当天的任务摘要（summary-YYYY-MM-DD.json）。
///          每条日志同时以 "[hh:mm:ss] LEVEL message" 形式通过 logLine 信号转发。
///          写盘失败只通过信号报告，不影响转换流程。
class JobLogger : public QObject
{
    Q_OBJECT
public:
    enum class Level
    {
        Debug,
        Info,
        Warn,
        Error
    };

    explicit JobLogger(const QString &logsDirectory, QObject *parent = nullptr);

    QString logsDirectory() const;
    QString logFilePath(const QDate &date = QDate::currentDate()) const;
    QString summaryFilePath(const QDate &date = QDate::currentDate()) const;

    void debug(const QString &jobId, const QString &message, const QJsonObject &details = QJsonObject());
    void info(const QString &jobId, const QString &message, const QJsonObject &details = QJsonObject());
    void warn(const QString &jobId, const QString &message, const QJsonObject &details = QJsonObject());
    void error(const QString &jobId, const QString &message, const CoordinatorError &error,
               const QJsonObject &details = QJsonObject());

    /// @brief 登记任务开始，后续该任务的日志自动附带书名与作者
    void startJob(const QString &jobId, const QString &bookTitle, const QString &author,
                  const QJsonObject &settings = QJsonObject());

    void completeJob(const QString &jobId, const QString &outputPath, int totalUnits);
    void failJob(const QString &jobId, const CoordinatorError &error);
    void cancelJob(const QString &jobId);

    /// @brief 读取某天的任务摘要
    QJsonArray readSummaries(const QDate &date = QDate::currentDate()) const;

    static QString levelName(Level level);

signals:
    void logLine(const QString &line);

private:
    struct JobContext
    {
        QString bookTitle;
        QString author;
        QDateTime startedAt;
    };

    void write(Level level, const QString &jobId, const QString &message,
               const QJsonObject &details, const CoordinatorError *error);
    bool appendLine(const QString &filePath, const QByteArray &line);
    void updateSummary(const QString &jobId, const QJsonObject &fields);

    QString m_logsDirectory;
    QHash<QString, JobContext> m_jobs;
};

#endif // JOBLOGGER_H
