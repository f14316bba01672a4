#include "coordinatorservice.h"

#include <QDir>
#include <QFileInfo>

#include "../Core/joblogger.h"
#include "../Modules/Engine/progresslineparser.h"
#include "../Modules/Engine/sessionpreparer.h"
#include "../Modules/Resume/resumemanager.h"
#include "conversionjob.h"

CoordinatorService::CoordinatorService(const CoordinatorSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_logger(new JobLogger(settings.resolvedLogsDirectory(), this))
    , m_parser(new Ebook2AudiobookProgressParser())
{
    qRegisterMetaType<AggregatedProgress>("AggregatedProgress");
    qRegisterMetaType<ConversionResult>("ConversionResult");
    qRegisterMetaType<PrepInfo>("PrepInfo");
    qRegisterMetaType<WorkerState>("WorkerState");
    qRegisterMetaType<CoordinatorError>("CoordinatorError");

    connect(m_logger, &JobLogger::logLine,
            this, &CoordinatorService::logLine);
}

CoordinatorService::~CoordinatorService()
{
    stopAll();
    if (m_preparer) {
        m_preparer->cancel();
    }
}

const CoordinatorSettings &CoordinatorService::settings() const
{
    return m_settings;
}

JobLogger *CoordinatorService::logger() const
{
    return m_logger;
}

void CoordinatorService::setProgressLineParser(const QSharedPointer<const ProgressLineParser> &parser)
{
    if (parser) {
        m_parser = parser;
    }
}

bool CoordinatorService::prepareSession(const QString &documentPath, const EngineSettings &engine)
{
    if (m_preparer && m_preparer->isRunning()) {
        return false;
    }

    if (!m_preparer) {
        m_preparer = new SessionPreparer(m_settings.engine, this);
        connect(m_preparer, &SessionPreparer::taskLog,
                this, [this](const QString &line) {
                    m_logger->debug(QString(), line);
                });
        connect(m_preparer, &SessionPreparer::preparationFinished,
                this, &CoordinatorService::sessionPrepared);
    }

    m_preparer->startPreparation(documentPath, engine);
    return true;
}

bool CoordinatorService::validateConfig(const QString &jobId, const ConversionConfig &config, bool requireDocument,
                                        QString *errorMessage) const
{
    QString error;
    if (jobId.trimmed().isEmpty()) {
        error = QStringLiteral("任务号不能为空。");
    } else if (m_jobs.contains(jobId)) {
        error = QStringLiteral("任务 %1 正在运行。").arg(jobId);
    } else if (requireDocument && !QFileInfo(config.documentPath).isFile()) {
        error = QStringLiteral("源文档不存在：%1").arg(config.documentPath);
    } else if (config.outputDir.trimmed().isEmpty()) {
        error = QStringLiteral("未指定输出目录。");
    } else if (!QDir().mkpath(config.outputDir)) {
        error = QStringLiteral("无法创建输出目录：%1").arg(config.outputDir);
    }

    if (error.isEmpty()) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = error;
    }
    return false;
}

bool CoordinatorService::startConversion(const QString &jobId, const ConversionConfig &config, QString *errorMessage)
{
    if (!validateConfig(jobId, config, true, errorMessage)) {
        return false;
    }

    ConversionJob *job = new ConversionJob(jobId, config, m_settings, m_parser, m_logger, this);
    registerJob(job);
    job->startFresh();
    return true;
}

bool CoordinatorService::resumeConversion(const QString &jobId,
                                          const ConversionConfig &config,
                                          const ResumeCheckResult &evidence,
                                          QString *errorMessage)
{
    if (!validateConfig(jobId, config, false, errorMessage)) {
        return false;
    }

    const ResumeManager resumeManager(m_settings);
    ResumeCheckResult checked = evidence;
    if (!resumeManager.ensureEvidenceComplete(config.documentPath, &checked, errorMessage)) {
        return false;
    }

    ConversionSession session;
    if (!resumeManager.buildResumeSession(jobId, config, checked, &session, errorMessage)) {
        return false;
    }

    ConversionJob *job = new ConversionJob(jobId, session.config, m_settings, m_parser, m_logger, this);
    registerJob(job);
    job->startResume(session);
    return true;
}

void CoordinatorService::registerJob(ConversionJob *job)
{
    m_jobs.insert(job->jobId(), job);
    connect(job, &ConversionJob::progressChanged,
            this, &CoordinatorService::progressChanged);
    connect(job, &ConversionJob::workerOutput,
            this, &CoordinatorService::workerOutput);
    connect(job, &ConversionJob::finished,
            this, &CoordinatorService::onJobFinished);
}

bool CoordinatorService::stopConversion(const QString &jobId)
{
    ConversionJob *job = m_jobs.value(jobId, nullptr);
    if (!job) {
        return false;
    }
    job->stop();
    return true;
}

bool CoordinatorService::progress(const QString &jobId, AggregatedProgress *progress) const
{
    const ConversionJob *job = m_jobs.value(jobId, nullptr);
    if (!job || !progress) {
        return false;
    }
    *progress = job->progress();
    return true;
}

ResumeCheckResult CoordinatorService::checkResumeStatus(const QString &documentPath, const QString &sessionId) const
{
    return ResumeManager(m_settings).checkResumeStatus(documentPath, sessionId);
}

QVector<ResumeCheckResult> CoordinatorService::listResumableSessions() const
{
    return ResumeManager(m_settings).listResumableSessions();
}

bool CoordinatorService::isConversionActive(const QString &jobId) const
{
    const ConversionJob *job = m_jobs.value(jobId, nullptr);
    return job && job->isActive();
}

QStringList CoordinatorService::activeJobs() const
{
    QStringList jobs;
    for (auto it = m_jobs.constBegin(); it != m_jobs.constEnd(); ++it) {
        if (it.value()->isActive()) {
            jobs << it.key();
        }
    }
    jobs.sort();
    return jobs;
}

void CoordinatorService::stopAll()
{
    // stop() 会同步发出 finished 并从表中移除，先取快照
    const QList<ConversionJob *> jobs = m_jobs.values();
    for (ConversionJob *job : jobs) {
        job->stop();
    }
}

void CoordinatorService::onJobFinished(const QString &jobId, const ConversionResult &result)
{
    ConversionJob *job = m_jobs.take(jobId);
    emit conversionFinished(jobId, result);
    if (job) {
        job->deleteLater();
    }
}
