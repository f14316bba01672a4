#include "joblogger.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

JobLogger::JobLogger(const QString &logsDirectory, QObject *parent)
    : QObject(parent)
    , m_logsDirectory(logsDirectory)
{
}

QString JobLogger::logsDirectory() const
{
    return m_logsDirectory;
}

QString JobLogger::logFilePath(const QDate &date) const
{
    return QDir(m_logsDirectory).filePath(
        QStringLiteral("audiobook-%1.log").arg(date.toString(QStringLiteral("yyyy-MM-dd"))));
}

QString JobLogger::summaryFilePath(const QDate &date) const
{
    return QDir(m_logsDirectory).filePath(
        QStringLiteral("summary-%1.json").arg(date.toString(QStringLiteral("yyyy-MM-dd"))));
}

void JobLogger::debug(const QString &jobId, const QString &message, const QJsonObject &details)
{
    write(Level::Debug, jobId, message, details, nullptr);
}

void JobLogger::info(const QString &jobId, const QString &message, const QJsonObject &details)
{
    write(Level::Info, jobId, message, details, nullptr);
}

void JobLogger::warn(const QString &jobId, const QString &message, const QJsonObject &details)
{
    write(Level::Warn, jobId, message, details, nullptr);
}

void JobLogger::error(const QString &jobId, const QString &message, const CoordinatorError &error,
                      const QJsonObject &details)
{
    write(Level::Error, jobId, message, details, &error);
}

void JobLogger::startJob(const QString &jobId, const QString &bookTitle, const QString &author,
                         const QJsonObject &settings)
{
    JobContext context;
    context.bookTitle = bookTitle;
    context.author = author;
    context.startedAt = QDateTime::currentDateTimeUtc();
    m_jobs.insert(jobId, context);

    info(jobId, QStringLiteral("Job started"), settings);

    QJsonObject fields;
    fields.insert(QStringLiteral("bookTitle"), bookTitle);
    fields.insert(QStringLiteral("author"), author);
    fields.insert(QStringLiteral("startTime"), context.startedAt.toString(Qt::ISODateWithMs));
    fields.insert(QStringLiteral("status"), QStringLiteral("running"));
    if (!settings.isEmpty()) {
        fields.insert(QStringLiteral("settings"), settings);
    }
    updateSummary(jobId, fields);
}

void JobLogger::completeJob(const QString &jobId, const QString &outputPath, int totalUnits)
{
    QJsonObject details;
    details.insert(QStringLiteral("outputPath"), outputPath);
    details.insert(QStringLiteral("totalSentences"), totalUnits);
    info(jobId, QStringLiteral("Job completed"), details);

    const QDateTime endTime = QDateTime::currentDateTimeUtc();
    QJsonObject fields;
    fields.insert(QStringLiteral("endTime"), endTime.toString(Qt::ISODateWithMs));
    fields.insert(QStringLiteral("status"), QStringLiteral("completed"));
    fields.insert(QStringLiteral("outputPath"), outputPath);
    fields.insert(QStringLiteral("totalSentences"), totalUnits);
    if (m_jobs.contains(jobId)) {
        fields.insert(QStringLiteral("duration"), m_jobs.value(jobId).startedAt.secsTo(endTime));
    }
    updateSummary(jobId, fields);
    m_jobs.remove(jobId);
}

void JobLogger::failJob(const QString &jobId, const CoordinatorError &failure)
{
    error(jobId, QStringLiteral("Job failed"), failure);

    const QDateTime endTime = QDateTime::currentDateTimeUtc();
    QJsonObject fields;
    fields.insert(QStringLiteral("endTime"), endTime.toString(Qt::ISODateWithMs));
    fields.insert(QStringLiteral("status"), QStringLiteral("failed"));
    fields.insert(QStringLiteral("error"), failure.message);
    if (m_jobs.contains(jobId)) {
        fields.insert(QStringLiteral("duration"), m_jobs.value(jobId).startedAt.secsTo(endTime));
    }
    updateSummary(jobId, fields);
    m_jobs.remove(jobId);
}

void JobLogger::cancelJob(const QString &jobId)
{
    warn(jobId, QStringLiteral("Job cancelled"));

    const QDateTime endTime = QDateTime::currentDateTimeUtc();
    QJsonObject fields;
    fields.insert(QStringLiteral("endTime"), endTime.toString(Qt::ISODateWithMs));
    fields.insert(QStringLiteral("status"), QStringLiteral("cancelled"));
    if (m_jobs.contains(jobId)) {
        fields.insert(QStringLiteral("duration"), m_jobs.value(jobId).startedAt.secsTo(endTime));
    }
    updateSummary(jobId, fields);
    m_jobs.remove(jobId);
}

QJsonArray JobLogger::readSummaries(const QDate &date) const
{
    QFile file(summaryFilePath(date));
    if (!file.open(QIODevice::ReadOnly)) {
        return QJsonArray();
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    return doc.isArray() ? doc.array() : QJsonArray();
}

QString JobLogger::levelName(Level level)
{
    switch (level) {
    case Level::Debug:
        return QStringLiteral("DEBUG");
    case Level::Info:
        return QStringLiteral("INFO");
    case Level::Warn:
        return QStringLiteral("WARN");
    case Level::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void JobLogger::write(Level level, const QString &jobId, const QString &message,
                      const QJsonObject &details, const CoordinatorError *error)
{
    const QDateTime now = QDateTime::currentDateTimeUtc();

    QJsonObject entry;
    entry.insert(QStringLiteral("timestamp"), now.toString(Qt::ISODateWithMs));
    entry.insert(QStringLiteral("level"), levelName(level));
    entry.insert(QStringLiteral("jobId"), jobId);
    const auto context = m_jobs.constFind(jobId);
    if (context != m_jobs.constEnd()) {
        if (!context->bookTitle.isEmpty()) {
            entry.insert(QStringLiteral("bookTitle"), context->bookTitle);
        }
        if (!context->author.isEmpty()) {
            entry.insert(QStringLiteral("author"), context->author);
        }
    }
    entry.insert(QStringLiteral("message"), message);
    if (!details.isEmpty()) {
        entry.insert(QStringLiteral("details"), details);
    }
    if (error && error->isError()) {
        QJsonObject errorObj;
        errorObj.insert(QStringLiteral("message"), error->message);
        errorObj.insert(QStringLiteral("code"), error->kindName());
        if (!error->details.isEmpty()) {
            errorObj.insert(QStringLiteral("details"), error->details);
        }
        entry.insert(QStringLiteral("error"), errorObj);
    }

    QString displayLine = QStringLiteral("[%1] %2 %3")
                              .arg(now.toLocalTime().toString(QStringLiteral("hh:mm:ss")),
                                   levelName(level), message);
    if (error && error->isError() && !error->message.isEmpty()) {
        displayLine += QStringLiteral(": %1").arg(error->message);
    }
    emit logLine(displayLine);

    const QByteArray line = QJsonDocument(entry).toJson(QJsonDocument::Compact) + '\n';
    if (!appendLine(logFilePath(now.toLocalTime().date()), line)) {
        emit logLine(QStringLiteral("[%1] WARN 无法写入日志文件：%2")
                         .arg(now.toLocalTime().toString(QStringLiteral("hh:mm:ss")),
                              logFilePath(now.toLocalTime().date())));
    }
}

bool JobLogger::appendLine(const QString &filePath, const QByteArray &line)
{
    if (!QDir().mkpath(m_logsDirectory)) {
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return false;
    }
    return file.write(line) == line.size();
}

void JobLogger::updateSummary(const QString &jobId, const QJsonObject &fields)
{
    QJsonArray summaries = readSummaries();

    int index = -1;
    for (int i = 0; i < summaries.size(); ++i) {
        if (summaries.at(i).toObject().value(QStringLiteral("jobId")).toString() == jobId) {
            index = i;
            break;
        }
    }

    QJsonObject summary = index >= 0 ? summaries.at(index).toObject() : QJsonObject();
    summary.insert(QStringLiteral("jobId"), jobId);
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        summary.insert(it.key(), it.value());
    }

    if (index >= 0) {
        summaries.replace(index, summary);
    } else {
        summaries.append(summary);
    }

    if (!QDir().mkpath(m_logsDirectory)) {
        emit logLine(QStringLiteral("[%1] WARN 无法创建日志目录：%2")
                         .arg(QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss")), m_logsDirectory));
        return;
    }

    QSaveFile file(summaryFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        emit logLine(QStringLiteral("[%1] WARN 无法写入任务摘要：%2")
                         .arg(QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss")), summaryFilePath()));
        return;
    }
    file.write(QJsonDocument(summaries).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit logLine(QStringLiteral("[%1] WARN 任务摘要提交失败：%2")
                         .arg(QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss")), summaryFilePath()));
    }
}
