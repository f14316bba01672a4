#include "workersupervisor.h"

#include <QDateTime>

#include "../../Core/processtreekiller.h"
#include "../Engine/enginecommandbuilder.h"
#include "../Engine/progresslineparser.h"

WorkerSupervisor::WorkerSupervisor(int workerId,
                                   const WorkerAssignment &assignment,
                                   const WorkerLaunchContext &context,
                                   const ProgressLineParser *parser,
                                   QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_parser(parser)
{
    m_state.id = workerId;
    m_state.assignment = assignment;
    m_state.currentUnit = assignment.unitAt(0);
}

WorkerSupervisor::~WorkerSupervisor()
{
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        if (!ProcessTreeKiller::terminateProcessTree(m_process->processId())) {
            m_process->kill();
        }
        m_process->waitForFinished(1000);
    }
}

int WorkerSupervisor::workerId() const
{
    return m_state.id;
}

const WorkerState &WorkerSupervisor::state() const
{
    return m_state;
}

bool WorkerSupervisor::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

QString WorkerSupervisor::outputTail() const
{
    return m_outputTail;
}

QProcess *WorkerSupervisor::createProcess()
{
    if (m_process) {
        m_process->disconnect(this);
        m_process->deleteLater();
    }

    QProcess *process = new QProcess(this);
    process->setProcessChannelMode(QProcess::MergedChannels);
    process->setProcessEnvironment(EngineCommandBuilder::engineEnvironment());
    if (!m_context.launch.workingDirectory.isEmpty()) {
        process->setWorkingDirectory(m_context.launch.workingDirectory);
    }

    connect(process, &QProcess::started,
            this, &WorkerSupervisor::onProcessStarted);
    connect(process, &QProcess::readyReadStandardOutput,
            this, &WorkerSupervisor::onReadyReadOutput);
    connect(process, static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished),
            this, &WorkerSupervisor::onProcessFinished);
    connect(process, &QProcess::errorOccurred,
            this, &WorkerSupervisor::onProcessErrorOccurred);

    return process;
}

bool WorkerSupervisor::start()
{
    if (isRunning() || m_cancelRequested) {
        return false;
    }

    resetAttemptCounters();

    const QStringList args = EngineCommandBuilder::buildWorkerArgs(m_context.launch,
                                                                   m_context.sessionId,
                                                                   m_context.outputDir,
                                                                   m_context.engine,
                                                                   m_state.assignment);

    m_state.status = WorkerStatus::Running;
    m_state.startedAtMs = QDateTime::currentMSecsSinceEpoch();
    m_state.lastProgressAtMs = m_state.startedAtMs;

    m_process = createProcess();
    emit outputLine(m_state.id, QStringLiteral("命令：%1 %2").arg(m_context.launch.program, args.join(' ')));
    m_process->start(m_context.launch.program, args);

    // FailedToStart 可能在 start() 内同步触发
    return m_state.status == WorkerStatus::Running;
}

bool WorkerSupervisor::canRetry(int maxRetries) const
{
    if (m_cancelRequested || m_state.permanentlyFailed) {
        return false;
    }
    if (m_state.status != WorkerStatus::Error || m_state.failureReason == WorkerFailureReason::Cancelled) {
        return false;
    }
    return m_state.retryCount < maxRetries;
}

bool WorkerSupervisor::retry()
{
    if (m_cancelRequested || isRunning()) {
        return false;
    }

    ++m_state.retryCount;
    return start();
}

void WorkerSupervisor::cancel()
{
    m_cancelRequested = true;

    if (!isRunning()) {
        if (m_state.status == WorkerStatus::Pending) {
            m_state.status = WorkerStatus::Error;
            m_state.failureReason = WorkerFailureReason::Cancelled;
            m_state.errorMessage = QStringLiteral("Cancelled");
        }
        return;
    }

    killProcessTree();
    m_process->waitForFinished(1000);
}

void WorkerSupervisor::terminateForStall(const QString &reason)
{
    if (!isRunning()) {
        return;
    }

    m_stallKillRequested = true;
    m_stallReason = reason;
    emit outputLine(m_state.id, QStringLiteral("工作进程 %1 卡死，强制终止：%2").arg(m_state.id).arg(reason));
    killProcessTree();
}

void WorkerSupervisor::markPermanentlyFailed()
{
    m_state.permanentlyFailed = true;
}

void WorkerSupervisor::onProcessStarted()
{
    m_state.pid = m_process->processId();
    emit started(m_state.id, m_state.pid);
}

void WorkerSupervisor::onReadyReadOutput()
{
    if (!m_process) {
        return;
    }

    const QString chunk = QString::fromUtf8(m_process->readAllStandardOutput());
    m_outputTail = boundedOutputTail(m_outputTail + chunk);
    m_stdoutBuffer += chunk;

    // 引擎的进度条使用 \r 刷新同一行
    m_stdoutBuffer.replace('\r', '\n');
    int newlineIndex = m_stdoutBuffer.indexOf('\n');
    while (newlineIndex >= 0) {
        const QString line = m_stdoutBuffer.left(newlineIndex).trimmed();
        m_stdoutBuffer.remove(0, newlineIndex + 1);
        if (!line.isEmpty()) {
            processOutputLine(line);
        }
        newlineIndex = m_stdoutBuffer.indexOf('\n');
    }
}

void WorkerSupervisor::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (!m_stdoutBuffer.trimmed().isEmpty()) {
        processOutputLine(m_stdoutBuffer.trimmed());
    }
    m_stdoutBuffer.clear();

    m_state.exitCode = exitCode;
    const int unitCount = m_state.assignment.unitCount();

    if (m_cancelRequested) {
        m_state.status = WorkerStatus::Error;
        m_state.failureReason = WorkerFailureReason::Cancelled;
        m_state.errorMessage = QStringLiteral("Cancelled");
    } else if (m_stallKillRequested) {
        m_state.status = WorkerStatus::Error;
        m_state.failureReason = WorkerFailureReason::Stalled;
        m_state.errorMessage = m_stallReason;
    } else if (exitStatus == QProcess::NormalExit && exitCode == 0) {
        m_state.status = WorkerStatus::Complete;
        m_state.completedUnits = unitCount;
        m_state.currentUnit = m_state.assignment.unitAt(unitCount - 1);
        if (m_context.resumeRun) {
            m_state.actualConversions = unitCount;
        }
        m_state.failureReason = WorkerFailureReason::None;
        m_state.errorMessage.clear();
    } else {
        m_state.status = WorkerStatus::Error;
        m_state.failureReason = WorkerFailureReason::ExitCode;
        m_state.errorMessage = exitStatus == QProcess::CrashExit
                                   ? QStringLiteral("Worker %1 crashed").arg(m_state.id)
                                   : QStringLiteral("Worker %1 exited with code %2").arg(m_state.id).arg(exitCode);
    }

    reportExit();
}

void WorkerSupervisor::onProcessErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart) {
        return;
    }

    m_state.status = WorkerStatus::Error;
    m_state.pid = 0;
    m_state.exitCode = -1;
    if (m_cancelRequested) {
        m_state.failureReason = WorkerFailureReason::Cancelled;
        m_state.errorMessage = QStringLiteral("Cancelled");
    } else {
        m_state.failureReason = WorkerFailureReason::SpawnFailure;
        m_state.errorMessage = QStringLiteral("Failed to start worker %1: %2")
                                   .arg(m_state.id)
                                   .arg(m_process ? m_process->errorString() : QString());
    }

    reportExit();
}

void WorkerSupervisor::resetAttemptCounters()
{
    m_state.completedUnits = 0;
    m_state.currentUnit = m_state.assignment.unitAt(0);
    m_state.actualConversions = 0;
    m_state.hasShownProgress = false;
    m_state.pid = 0;
    m_state.exitCode = 0;
    m_state.errorMessage.clear();
    m_state.failureReason = WorkerFailureReason::None;
    m_stdoutBuffer.clear();
    m_stallReason.clear();
    m_stallKillRequested = false;
    m_sawRecoveryMarker = false;
    m_exitReported = false;
}

void WorkerSupervisor::processOutputLine(const QString &line)
{
    emit outputLine(m_state.id, line);

    if (!m_parser || m_state.status != WorkerStatus::Running) {
        return;
    }

    const int unitCount = m_state.assignment.unitCount();
    bool changed = false;

    if (m_context.resumeRun && m_parser->isRecoveryMarker(line)) {
        m_sawRecoveryMarker = true;
        m_state.actualConversions = qMin(unitCount, m_state.actualConversions + 1);
        changed = true;
    }

    UnitProgress progress;
    if (m_parser->parseProgressLine(line, &progress)) {
        const int completed = qBound(0, progress.current, unitCount);

        // 已见到补齐标记时只按标记计数，避免与进度增量重复统计
        if (m_context.resumeRun && !m_sawRecoveryMarker && completed > m_state.completedUnits) {
            m_state.actualConversions = qMin(unitCount,
                                             m_state.actualConversions + (completed - m_state.completedUnits));
        }

        m_state.completedUnits = qMax(m_state.completedUnits, completed);
        m_state.currentUnit = m_state.assignment.unitAt(qMax(0, progress.current - 1));
        changed = true;
    }

    if (changed) {
        m_state.lastProgressAtMs = QDateTime::currentMSecsSinceEpoch();
        m_state.hasShownProgress = true;
        emit progressed(m_state.id);
    }
}

void WorkerSupervisor::killProcessTree()
{
    if (!m_process || m_process->state() == QProcess::NotRunning) {
        return;
    }

    QString killError;
    if (!ProcessTreeKiller::terminateProcessTree(m_process->processId(), &killError)) {
        emit outputLine(m_state.id, killError);
    }
    m_process->kill();
}

void WorkerSupervisor::reportExit()
{
    if (m_exitReported) {
        return;
    }
    m_exitReported = true;
    emit exited(m_state.id, m_state);
}
