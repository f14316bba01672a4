#include "conversionjob.h"

#include <QDateTime>
#include <QFileInfo>
#include <QTimer>

#include <cmath>

#include "../Core/joblogger.h"
#include "../Modules/Assembly/assemblycoordinator.h"
#include "../Modules/Assembly/audioenhancer.h"
#include "../Modules/Engine/progresslineparser.h"
#include "../Modules/Engine/sessionpreparer.h"
#include "../Modules/Partition/rangepartitioner.h"
#include "../Modules/Worker/workersupervisor.h"

namespace {

QString bookTitleFor(const ConversionConfig &config)
{
    if (!config.metadata.title.trimmed().isEmpty()) {
        return config.metadata.title.trimmed();
    }
    return QFileInfo(config.documentPath).completeBaseName();
}

double roundedPerMinute(int units, int durationSeconds)
{
    if (durationSeconds <= 0 || units <= 0) {
        return 0.0;
    }
    return std::round(units / (durationSeconds / 60.0) * 10.0) / 10.0;
}

} // namespace

ConversionJob::ConversionJob(const QString &jobId,
                             const ConversionConfig &config,
                             const CoordinatorSettings &settings,
                             const QSharedPointer<const ProgressLineParser> &parser,
                             JobLogger *logger,
                             QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_parser(parser)
    , m_logger(logger)
    , m_watchdog(settings.watchdog)
    , m_aggregator(settings.eta)
{
    m_session.jobId = jobId;
    m_session.config = config;
    m_session.config.workerCount = qMax(1, config.workerCount);

    connect(&m_watchdog, &Watchdog::checkRequested,
            this, &ConversionJob::onWatchdogCheck);
}

ConversionJob::~ConversionJob()
{
    m_watchdog.stop();
}

QString ConversionJob::jobId() const
{
    return m_session.jobId;
}

const ConversionSession &ConversionJob::session() const
{
    return m_session;
}

bool ConversionJob::isActive() const
{
    return !m_finished;
}

AggregatedProgress ConversionJob::progress() const
{
    return m_lastProgress;
}

void ConversionJob::startFresh()
{
    m_session.isResume = false;
    m_session.phase = ConversionPhase::Preparing;

    m_logger->startJob(m_session.jobId, bookTitleFor(m_session.config),
                       m_session.config.metadata.author, m_session.config.toJson());
    m_logger->info(m_session.jobId, QStringLiteral("Preparing session"),
                   QJsonObject{{QStringLiteral("document"), m_session.config.documentPath},
                               {QStringLiteral("workers"), m_session.config.workerCount}});

    AggregatedProgress initial;
    initial.phase = ConversionPhase::Preparing;
    initial.message = QStringLiteral("Preparing session...");
    publish(initial);

    m_preparer = new SessionPreparer(m_settings.engine, this);
    connect(m_preparer, &SessionPreparer::taskLog,
            this, &ConversionJob::onPreparationLog);
    connect(m_preparer, &SessionPreparer::preparationFinished,
            this, &ConversionJob::onPreparationFinished);
    m_preparer->startPreparation(m_session.config.documentPath, m_session.config.engine);
}

void ConversionJob::startResume(const ConversionSession &session)
{
    m_session = session;
    m_session.isResume = true;
    m_session.phase = ConversionPhase::Preparing;
    m_session.cancelled = false;

    m_logger->startJob(m_session.jobId, bookTitleFor(m_session.config),
                       m_session.config.metadata.author, m_session.config.toJson());
    m_logger->info(m_session.jobId, QStringLiteral("Resuming session %1").arg(m_session.prepInfo.sessionId),
                   QJsonObject{{QStringLiteral("completed"), m_session.baselineCompleted},
                               {QStringLiteral("missing"), m_session.totalMissing},
                               {QStringLiteral("workers"), m_session.workers.size()}});

    if (m_session.workers.isEmpty()) {
        m_logger->info(m_session.jobId, QStringLiteral("All units already converted, assembling only"));
        m_session.startTimeMs = QDateTime::currentMSecsSinceEpoch();
        startAssembly();
        return;
    }

    launchWorkers();
}

void ConversionJob::stop()
{
    if (m_finished) {
        return;
    }

    m_session.cancelled = true;
    m_watchdog.stop();
    m_pendingRetries.clear();
    m_logger->warn(m_session.jobId, QStringLiteral("Conversion stopped by user"));

    if (m_preparer) {
        m_preparer->cancel();
    }
    for (WorkerSupervisor *supervisor : m_supervisors) {
        supervisor->cancel();
    }
    if (m_assembly) {
        m_assembly->cancel();
    }
    if (m_enhancer) {
        m_enhancer->cancel();
    }

    syncWorkerStates();
    finishWith(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Cancelled,
                                                        QStringLiteral("Cancelled by user")));
}

void ConversionJob::onPreparationLog(const QString &line)
{
    m_logger->debug(m_session.jobId, line);
}

void ConversionJob::onPreparationFinished(bool success, const PrepInfo &info, const CoordinatorError &error)
{
    if (m_finished || m_session.cancelled) {
        return;
    }

    if (!success) {
        finishWith(false, QString(), error);
        return;
    }

    m_session.prepInfo = info;
    m_logger->info(m_session.jobId, QStringLiteral("Session prepared"),
                   QJsonObject{{QStringLiteral("sessionId"), info.sessionId},
                               {QStringLiteral("totalUnits"), info.totalUnits},
                               {QStringLiteral("totalChapters"), info.totalChapters}});

    QString partitionError;
    if (!buildFreshWorkers(&partitionError)) {
        finishWith(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Preparation, partitionError));
        return;
    }

    m_session.startTimeMs = QDateTime::currentMSecsSinceEpoch();
    launchWorkers();
}

bool ConversionJob::buildFreshWorkers(QString *errorMessage)
{
    const PrepInfo &info = m_session.prepInfo;
    if (info.totalUnits <= 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Session %1 contains no sentences").arg(info.sessionId);
        }
        return false;
    }

    QVector<WorkerAssignment> assignments;
    if (m_session.config.partitionMode == PartitionMode::Chapters) {
        if (info.chapters.isEmpty()) {
            m_logger->warn(m_session.jobId, QStringLiteral("No chapter boundaries recorded, falling back to sentence ranges"));
        } else {
            assignments = RangePartitioner::partitionChapters(info.chapters, m_session.config.workerCount);
        }
    }
    if (assignments.isEmpty()) {
        assignments = RangePartitioner::toAssignments(
            RangePartitioner::partitionUnits(info.totalUnits, m_session.config.workerCount));
    }

    m_session.workers.clear();
    for (int i = 0; i < assignments.size(); ++i) {
        WorkerState worker;
        worker.id = i;
        worker.assignment = assignments.at(i);
        worker.currentUnit = worker.assignment.unitAt(0);
        m_session.workers.append(worker);
    }
    return true;
}

void ConversionJob::launchWorkers()
{
    m_session.advancePhase(ConversionPhase::Converting);
    m_aggregator.reset();

    WorkerLaunchContext context;
    context.launch = m_settings.engine;
    context.sessionId = m_session.prepInfo.sessionId;
    context.outputDir = m_session.config.outputDir;
    context.engine = m_session.config.engine;
    context.resumeRun = m_session.isResume;

    for (const WorkerState &worker : m_session.workers) {
        WorkerSupervisor *supervisor = new WorkerSupervisor(worker.id, worker.assignment, context, m_parser.data(), this);
        connect(supervisor, &WorkerSupervisor::started,
                this, &ConversionJob::onWorkerStarted);
        connect(supervisor, &WorkerSupervisor::progressed,
                this, &ConversionJob::onWorkerProgressed);
        connect(supervisor, &WorkerSupervisor::outputLine,
                this, &ConversionJob::onWorkerOutputLine);
        connect(supervisor, &WorkerSupervisor::exited,
                this, &ConversionJob::onWorkerExited);
        m_supervisors.append(supervisor);
    }

    AggregatedProgress starting = m_aggregator.aggregate(m_session, QDateTime::currentMSecsSinceEpoch());
    starting.message = QStringLiteral("Starting %1 workers...").arg(m_supervisors.size());
    publish(starting);

    // 预处理已把全部数据写入会话状态，工作进程之间没有竞争，全部立即启动
    for (WorkerSupervisor *supervisor : m_supervisors) {
        if (m_session.cancelled) {
            break;
        }
        const WorkerAssignment &assignment = supervisor->state().assignment;
        m_logger->info(m_session.jobId, QStringLiteral("Starting worker %1").arg(supervisor->workerId()),
                       assignment.toJson());
        if (!supervisor->start()) {
            m_logger->warn(m_session.jobId, QStringLiteral("Worker %1 did not start").arg(supervisor->workerId()));
        }
    }

    if (!m_finished && !m_session.cancelled) {
        m_watchdog.start();
        checkAllWorkersDone();
    }
}

void ConversionJob::onWorkerStarted(int workerId, qint64 pid)
{
    m_logger->debug(m_session.jobId, QStringLiteral("Worker %1 started (pid %2)").arg(workerId).arg(pid));
    publishProgress();
}

void ConversionJob::onWorkerProgressed(int workerId)
{
    Q_UNUSED(workerId)
    publishProgress();
}

void ConversionJob::onWorkerOutputLine(int workerId, const QString &line)
{
    emit workerOutput(m_session.jobId, workerId, line);
}

void ConversionJob::onWorkerExited(int workerId, const WorkerState &state)
{
    syncWorkerStates();
    if (m_finished || m_session.cancelled) {
        return;
    }

    WorkerSupervisor *supervisor = supervisorFor(workerId);
    if (!supervisor) {
        return;
    }

    if (state.status == WorkerStatus::Complete) {
        m_logger->info(m_session.jobId, QStringLiteral("Worker %1 complete").arg(workerId),
                       QJsonObject{{QStringLiteral("units"), state.assignment.unitCount()},
                                   {QStringLiteral("retries"), state.retryCount}});
    } else if (supervisor->canRetry(m_settings.maxWorkerRetries)) {
        m_logger->warn(m_session.jobId,
                       QStringLiteral("Worker %1 failed, retrying (%2/%3)")
                           .arg(workerId)
                           .arg(state.retryCount + 1)
                           .arg(m_settings.maxWorkerRetries),
                       QJsonObject{{QStringLiteral("reason"), workerFailureReasonName(state.failureReason)},
                                   {QStringLiteral("error"), state.errorMessage}});
        scheduleRetry(supervisor);
    } else if (state.failureReason != WorkerFailureReason::Cancelled) {
        supervisor->markPermanentlyFailed();
        syncWorkerStates();
        const CoordinatorErrorKind kind = state.failureReason == WorkerFailureReason::Stalled
                                              ? CoordinatorErrorKind::Stall
                                              : CoordinatorErrorKind::Worker;
        m_logger->error(m_session.jobId,
                        QStringLiteral("Worker %1 failed permanently after %2 retries").arg(workerId).arg(state.retryCount),
                        CoordinatorError::make(kind, state.errorMessage, supervisor->outputTail(), state.exitCode));
    }

    publishProgress();
    checkAllWorkersDone();
}

void ConversionJob::scheduleRetry(WorkerSupervisor *supervisor)
{
    const int workerId = supervisor->workerId();
    m_pendingRetries.insert(workerId);

    // 不在 exited 处理函数内重启，避免旧进程的信号重入
    QTimer::singleShot(0, supervisor, [this, supervisor, workerId]() {
        if (!m_pendingRetries.remove(workerId) || m_finished || m_session.cancelled) {
            return;
        }
        if (!supervisor->retry()) {
            m_logger->warn(m_session.jobId, QStringLiteral("Worker %1 retry did not start").arg(workerId));
        }
        syncWorkerStates();
        publishProgress();
        checkAllWorkersDone();
    });
}

void ConversionJob::onWatchdogCheck()
{
    if (m_finished || m_session.cancelled) {
        return;
    }

    syncWorkerStates();
    const QVector<StalledWorker> stalled = Watchdog::findStalledWorkers(m_session.workers,
                                                                        QDateTime::currentMSecsSinceEpoch(),
                                                                        m_settings.watchdog);
    for (const StalledWorker &hit : stalled) {
        WorkerSupervisor *supervisor = supervisorFor(hit.workerId);
        if (!supervisor) {
            continue;
        }
        m_logger->warn(m_session.jobId, QStringLiteral("Worker %1 appears stalled: %2").arg(hit.workerId).arg(hit.reason()),
                       QJsonObject{{QStringLiteral("silentForMs"), static_cast<double>(hit.silentForMs)}});
        supervisor->terminateForStall(hit.reason());
    }
}

void ConversionJob::syncWorkerStates()
{
    for (WorkerSupervisor *supervisor : m_supervisors) {
        const int index = supervisor->workerId();
        if (index >= 0 && index < m_session.workers.size()) {
            m_session.workers[index] = supervisor->state();
        }
    }
}

void ConversionJob::checkAllWorkersDone()
{
    if (m_finished || m_session.cancelled || m_session.phase != ConversionPhase::Converting) {
        return;
    }
    if (!m_pendingRetries.isEmpty()) {
        return;
    }
    if (countWorkers(WorkerStatus::Pending) > 0 || countWorkers(WorkerStatus::Running) > 0) {
        return;
    }

    m_watchdog.stop();

    const int completed = countWorkers(WorkerStatus::Complete);
    if (completed == 0) {
        finishWith(false, QString(), CoordinatorError::make(CoordinatorErrorKind::PermanentWorkerFailure,
                                                            QStringLiteral("All workers failed")));
        return;
    }

    const int failed = failedWorkerCount();
    if (failed > 0) {
        m_logger->warn(m_session.jobId,
                       QStringLiteral("%1 of %2 workers failed, assembling what was converted")
                           .arg(failed)
                           .arg(m_session.workers.size()));
    } else {
        m_logger->info(m_session.jobId, QStringLiteral("All workers complete"));
    }

    startAssembly();
}

void ConversionJob::startAssembly()
{
    m_session.advancePhase(ConversionPhase::Assembling);
    m_logger->info(m_session.jobId, QStringLiteral("Assembling final audiobook"));

    AssemblyRequest request;
    request.documentPath = m_session.prepInfo.sourceDocumentPath.isEmpty()
                               ? m_session.config.documentPath
                               : m_session.prepInfo.sourceDocumentPath;
    request.outputDir = m_session.config.outputDir;
    request.sessionId = m_session.prepInfo.sessionId;
    request.engine = m_session.config.engine;
    request.metadata = m_session.config.metadata;
    request.totalChapters = m_session.prepInfo.totalChapters;

    m_assembly = new AssemblyCoordinator(m_settings, this);
    connect(m_assembly, &AssemblyCoordinator::taskLog,
            this, &ConversionJob::onAssemblyLog);
    connect(m_assembly, &AssemblyCoordinator::progressChanged,
            this, &ConversionJob::onAssemblyProgress);
    connect(m_assembly, &AssemblyCoordinator::assemblyFinished,
            this, &ConversionJob::onAssemblyFinished);
    m_assembly->startAssembly(request);
}

void ConversionJob::onAssemblyLog(const QString &line)
{
    m_logger->debug(m_session.jobId, line);
}

void ConversionJob::onAssemblyProgress(const AssemblyProgress &progress)
{
    if (m_finished || m_session.phase != ConversionPhase::Assembling) {
        return;
    }

    AggregatedProgress snapshot;
    snapshot.phase = ConversionPhase::Assembling;
    snapshot.totalUnits = m_session.prepInfo.totalUnits;
    snapshot.completedUnits = qMin(m_session.prepInfo.totalUnits, ProgressAggregator::completedUnits(m_session));
    snapshot.completedInSession = ProgressAggregator::completedInSession(m_session);
    snapshot.percentage = progress.overallPercent;
    snapshot.activeWorkers = 0;
    snapshot.workers = m_session.workers;
    snapshot.estimatedRemainingSeconds = qMax(10, qRound((100 - progress.overallPercent) * 0.6));
    snapshot.message = progress.message;
    snapshot.assemblySubPhase = progress.subPhase;
    snapshot.assemblyProgress = progress.subProgress;
    snapshot.assemblyChapter = progress.chapter;
    snapshot.assemblyTotalChapters = progress.totalChapters;
    publish(snapshot);
}

void ConversionJob::onAssemblyFinished(bool success, const QString &outputPath, const CoordinatorError &error)
{
    if (m_finished || m_session.cancelled) {
        return;
    }
    if (success && m_settings.enhancement.appliesTo(m_session.config.engine.ttsEngine)) {
        startEnhancement(outputPath);
        return;
    }
    finishWith(success, outputPath, error);
}

void ConversionJob::startEnhancement(const QString &outputPath)
{
    m_session.advancePhase(ConversionPhase::Enhancing);
    m_logger->info(m_session.jobId, QStringLiteral("Enhancing audio quality"),
                   QJsonObject{{QStringLiteral("outputPath"), outputPath},
                               {QStringLiteral("program"), m_settings.enhancement.program}});
    publishEnhancing(-1);

    m_enhancer = new AudioEnhancer(m_settings.enhancement, this);
    connect(m_enhancer, &AudioEnhancer::taskLog,
            this, &ConversionJob::onAssemblyLog);
    connect(m_enhancer, &AudioEnhancer::progressChanged,
            this, &ConversionJob::onEnhancementProgress);
    connect(m_enhancer, &AudioEnhancer::enhancementFinished,
            this, &ConversionJob::onEnhancementFinished);
    m_enhancer->startEnhancement(outputPath);
}

void ConversionJob::publishEnhancing(int percent)
{
    AggregatedProgress snapshot;
    snapshot.phase = ConversionPhase::Enhancing;
    snapshot.totalUnits = m_session.prepInfo.totalUnits;
    snapshot.completedUnits = qMin(m_session.prepInfo.totalUnits, ProgressAggregator::completedUnits(m_session));
    snapshot.completedInSession = ProgressAggregator::completedInSession(m_session);
    snapshot.percentage = 98;
    snapshot.activeWorkers = 0;
    snapshot.workers = m_session.workers;
    snapshot.estimatedRemainingSeconds = 300;
    snapshot.message = percent < 0 ? QStringLiteral("Enhancing audio quality (removing reverb)...")
                                   : QStringLiteral("Enhancing audio: %1%").arg(percent);
    publish(snapshot);
}

void ConversionJob::onEnhancementProgress(int percent)
{
    if (m_finished || m_session.phase != ConversionPhase::Enhancing) {
        return;
    }
    publishEnhancing(percent);
}

void ConversionJob::onEnhancementFinished(bool success, const QString &outputPath, const CoordinatorError &error)
{
    if (m_finished || m_session.cancelled) {
        return;
    }
    if (!success) {
        m_logger->warn(m_session.jobId, QStringLiteral("Enhancement failed, keeping unenhanced audiobook"),
                       QJsonObject{{QStringLiteral("error"), error.message}});
    }
    finishWith(true, outputPath, CoordinatorError());
}

void ConversionJob::publishProgress()
{
    if (m_finished || m_session.phase != ConversionPhase::Converting) {
        return;
    }
    syncWorkerStates();
    publish(m_aggregator.aggregate(m_session, QDateTime::currentMSecsSinceEpoch()));
}

void ConversionJob::publish(const AggregatedProgress &progress)
{
    m_lastProgress = progress;
    emit progressChanged(m_session.jobId, progress);
}

void ConversionJob::finishWith(bool success, const QString &outputPath, const CoordinatorError &error)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_watchdog.stop();
    m_pendingRetries.clear();
    syncWorkerStates();

    const bool cancelled = error.kind == CoordinatorErrorKind::Cancelled;
    m_session.advancePhase(success ? ConversionPhase::Complete : ConversionPhase::Error);

    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    const qint64 startMs = m_session.startTimeMs > 0 ? m_session.startTimeMs : nowMs;
    const int duration = qRound((nowMs - startMs) / 1000.0);
    const int totalUnits = m_session.prepInfo.totalUnits;
    const int completed = qMin(totalUnits, ProgressAggregator::completedUnits(m_session));

    // 全新转换成功时本次完成数即单元总数；续传只统计本次实际补齐的单元
    int doneInSession = ProgressAggregator::completedInSession(m_session);
    if (success && !m_session.isResume) {
        doneInSession = totalUnits;
    }

    ConversionAnalytics analytics;
    analytics.jobId = m_session.jobId;
    analytics.startedAt = QDateTime::fromMSecsSinceEpoch(startMs).toUTC().toString(Qt::ISODateWithMs);
    analytics.completedAt = QDateTime::fromMSecsSinceEpoch(nowMs).toUTC().toString(Qt::ISODateWithMs);
    analytics.durationSeconds = duration;
    analytics.totalUnits = totalUnits;
    analytics.totalChapters = m_session.prepInfo.totalChapters;
    analytics.workerCount = m_session.config.workerCount;
    analytics.unitsPerMinute = roundedPerMinute(doneInSession, duration);
    analytics.settings = m_session.config.engine;
    analytics.success = success;
    analytics.outputPath = outputPath;
    analytics.error = error.message;
    analytics.isResume = m_session.isResume;
    analytics.unitsProcessedInSession = doneInSession;
    analytics.failedWorkers = failedWorkerCount();
    analytics.wasCancelled = cancelled;
    analytics.completedUnitsAtCancel = cancelled ? completed : 0;

    ConversionResult result;
    result.success = success;
    result.outputPath = outputPath;
    result.error = error;
    result.durationSeconds = duration;
    result.failedWorkers = analytics.failedWorkers;
    result.analytics = analytics;

    AggregatedProgress finalProgress;
    finalProgress.phase = m_session.phase;
    finalProgress.totalUnits = totalUnits;
    finalProgress.completedUnits = success ? totalUnits : completed;
    finalProgress.completedInSession = doneInSession;
    finalProgress.percentage = success ? 100 : (totalUnits > 0 ? qMin(100, qRound(completed * 100.0 / totalUnits)) : 0);
    finalProgress.activeWorkers = 0;
    finalProgress.workers = m_session.workers;
    finalProgress.estimatedRemainingSeconds = 0;
    finalProgress.message = success ? QStringLiteral("Conversion complete!") : error.message;
    finalProgress.error = success ? QString() : error.message;

    if (success) {
        m_logger->info(m_session.jobId, QStringLiteral("Conversion complete"),
                       QJsonObject{{QStringLiteral("duration"), duration},
                                   {QStringLiteral("outputPath"), outputPath},
                                   {QStringLiteral("failedWorkers"), result.failedWorkers}});
        m_logger->completeJob(m_session.jobId, outputPath, totalUnits);
    } else if (cancelled) {
        m_logger->cancelJob(m_session.jobId);
    } else {
        m_logger->error(m_session.jobId, QStringLiteral("Conversion failed"), error,
                        QJsonObject{{QStringLiteral("duration"), duration}});
        m_logger->failJob(m_session.jobId, error);
    }

    publish(finalProgress);
    emit finished(m_session.jobId, result);
}

int ConversionJob::countWorkers(WorkerStatus status) const
{
    int count = 0;
    for (const WorkerState &worker : m_session.workers) {
        if (worker.status == status) {
            ++count;
        }
    }
    return count;
}

int ConversionJob::failedWorkerCount() const
{
    int count = 0;
    for (const WorkerState &worker : m_session.workers) {
        if (worker.status == WorkerStatus::Error && worker.failureReason != WorkerFailureReason::Cancelled) {
            ++count;
        }
    }
    return count;
}

WorkerSupervisor *ConversionJob::supervisorFor(int workerId) const
{
    for (WorkerSupervisor *supervisor : m_supervisors) {
        if (supervisor->workerId() == workerId) {
            return supervisor;
        }
    }
    return nullptr;
}
