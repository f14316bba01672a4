#include "resumemanager.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

#include "../Engine/sessionpreparer.h"
#include "../Partition/rangepartitioner.h"

ResumeManager::ResumeManager(const CoordinatorSettings &settings)
    : m_settings(settings)
{
}

QStringList ResumeManager::candidateSessionDirs() const
{
    QStringList dirs;
    const QDir root(m_settings.engine.resolvedSessionsRoot());
    if (!root.exists()) {
        return dirs;
    }

    // 按修改时间倒序
    const QFileInfoList entries = root.entryInfoList(QStringList() << QStringLiteral("ebook-*"),
                                                     QDir::Dirs | QDir::NoDotAndDotDot, QDir::Time);
    for (const QFileInfo &entry : entries) {
        dirs << entry.absoluteFilePath();
    }
    return dirs;
}

QString ResumeManager::findSessionForDocument(const QString &documentPath) const
{
    for (const QString &sessionDir : candidateSessionDirs()) {
        PrepInfo info;
        if (!SessionPreparer::readPrepInfo(sessionDir, &info)) {
            continue;
        }
        if (matchesDocument(info.documentPaths(), documentPath)) {
            return sessionDir;
        }
    }
    return QString();
}

ResumeCheckResult ResumeManager::checkResumeStatus(const QString &documentPath, const QString &sessionId) const
{
    QString sessionDir;
    if (!sessionId.trimmed().isEmpty()) {
        sessionDir = SessionPreparer::sessionDirFor(m_settings.engine.resolvedSessionsRoot(), sessionId.trimmed());
        if (!QFileInfo(sessionDir).isDir()) {
            ResumeCheckResult result;
            result.error = QStringLiteral("会话不存在：%1").arg(sessionId);
            return result;
        }
    } else {
        sessionDir = findSessionForDocument(documentPath);
        if (sessionDir.isEmpty()) {
            ResumeCheckResult result;
            result.error = QStringLiteral("没有找到该文档的会话：%1").arg(documentPath);
            return result;
        }
    }

    ResumeCheckResult result = inspectSession(sessionDir);
    QStringList recordedPaths;
    for (const QString &path : {result.sourceDocumentPath, result.engineDocumentPath}) {
        if (!path.isEmpty()) {
            recordedPaths << path;
        }
    }
    if (result.success && !sessionId.trimmed().isEmpty() && !recordedPaths.isEmpty()
        && !matchesDocument(recordedPaths, documentPath)) {
        ResumeCheckResult mismatch;
        mismatch.error = QStringLiteral("会话 %1 对应的文档为 %2，而不是 %3")
                             .arg(sessionId, result.sourceDocumentPath, documentPath);
        return mismatch;
    }
    return result;
}

ResumeCheckResult ResumeManager::inspectSession(const QString &sessionDir) const
{
    ResumeCheckResult result;

    PrepInfo info;
    QString readError;
    if (!SessionPreparer::readPrepInfo(sessionDir, &info, &readError)) {
        result.error = readError;
        return result;
    }

    bool readable = false;
    const QSet<int> completed = scanCompletedUnits(info.sentencesDir, m_settings.sentenceExtension, &readable);
    QSet<int> inRange;
    for (int index : completed) {
        if (index >= 0 && index < info.totalUnits) {
            inRange.insert(index);
        }
    }

    result.success = true;
    result.sessionId = info.sessionId;
    result.sessionDir = info.sessionDir;
    result.processDir = info.processDir;
    result.sentencesDir = info.sentencesDir;
    result.chaptersDir = info.chaptersDir;
    result.sourceDocumentPath = info.sourceDocumentPath;
    result.engineDocumentPath = info.engineDocumentPath;
    result.totalUnits = info.totalUnits;
    result.totalChapters = info.totalChapters;
    result.chapters = info.chapters;
    result.metadata = info.metadata;

    // 目录不可读时按全部缺失处理
    result.completedUnits = readable ? inRange.size() : 0;
    result.missingIndices = computeMissing(info.totalUnits, readable ? inRange : QSet<int>());
    result.missingUnits = result.missingIndices.size();
    result.missingRanges = RangePartitioner::compressToRanges(result.missingIndices);
    result.complete = info.totalUnits > 0 && result.completedUnits >= info.totalUnits;
    result.canResume = !result.complete && result.completedUnits > 0;
    result.progressPercent = info.totalUnits > 0
                                 ? qRound(result.completedUnits * 100.0 / info.totalUnits)
                                 : 0;
    return result;
}

QVector<ResumeCheckResult> ResumeManager::listResumableSessions() const
{
    QVector<ResumeCheckResult> sessions;
    for (const QString &sessionDir : candidateSessionDirs()) {
        const ResumeCheckResult result = inspectSession(sessionDir);
        if (result.success && result.canResume) {
            sessions.append(result);
        }
    }
    return sessions;
}

bool ResumeManager::ensureEvidenceComplete(const QString &documentPath, ResumeCheckResult *evidence, QString *errorMessage) const
{
    if (!evidence) {
        return false;
    }

    const bool missingCritical = evidence->sessionId.isEmpty()
                                 || evidence->processDir.isEmpty()
                                 || evidence->sentencesDir.isEmpty()
                                 || evidence->totalUnits <= 0
                                 || (evidence->missingIndices.isEmpty() && !evidence->complete);
    if (evidence->success && !missingCritical) {
        return true;
    }

    const ResumeCheckResult refreshed = checkResumeStatus(documentPath, evidence->sessionId);
    if (!refreshed.success) {
        if (errorMessage) {
            *errorMessage = refreshed.error;
        }
        return false;
    }

    *evidence = refreshed;
    return true;
}

bool ResumeManager::buildResumeSession(const QString &jobId,
                                       const ConversionConfig &config,
                                       const ResumeCheckResult &evidence,
                                       ConversionSession *session,
                                       QString *errorMessage) const
{
    if (!session) {
        return false;
    }
    if (!evidence.success || evidence.sessionId.isEmpty() || evidence.totalUnits <= 0) {
        if (errorMessage) {
            *errorMessage = evidence.error.isEmpty() ? QStringLiteral("续传证据不完整。") : evidence.error;
        }
        return false;
    }

    ConversionSession result;
    result.jobId = jobId;
    result.config = config;
    result.isResume = true;
    result.startTimeMs = QDateTime::currentMSecsSinceEpoch();
    result.baselineCompleted = evidence.completedUnits;
    result.totalMissing = evidence.missingUnits;

    result.prepInfo.sessionId = evidence.sessionId;
    result.prepInfo.sessionDir = evidence.sessionDir;
    result.prepInfo.processDir = evidence.processDir;
    result.prepInfo.chaptersDir = evidence.chaptersDir;
    result.prepInfo.sentencesDir = evidence.sentencesDir;
    result.prepInfo.sourceDocumentPath = evidence.sourceDocumentPath;
    result.prepInfo.engineDocumentPath = evidence.engineDocumentPath;
    result.prepInfo.totalUnits = evidence.totalUnits;
    result.prepInfo.totalChapters = evidence.totalChapters;
    result.prepInfo.chapters = evidence.chapters;
    result.prepInfo.metadata = evidence.metadata;

    const QVector<WorkerAssignment> assignments = RangePartitioner::partitionIndexList(evidence.missingIndices,
                                                                                       config.workerCount);
    for (int i = 0; i < assignments.size(); ++i) {
        WorkerState worker;
        worker.id = i;
        worker.assignment = assignments.at(i);
        worker.currentUnit = worker.assignment.unitAt(0);
        result.workers.append(worker);
    }

    *session = result;
    return true;
}

QSet<int> ResumeManager::scanCompletedUnits(const QString &sentencesDir, const QString &extension, bool *readable)
{
    QSet<int> completed;
    const QDir dir(sentencesDir);
    if (sentencesDir.isEmpty() || !dir.exists() || !dir.isReadable()) {
        if (readable) {
            *readable = false;
        }
        return completed;
    }
    if (readable) {
        *readable = true;
    }

    const QRegularExpression unitRegex(QStringLiteral("^(\\d+)\\.%1$").arg(QRegularExpression::escape(extension)));
    const QStringList files = dir.entryList(QDir::Files);
    for (const QString &file : files) {
        const QRegularExpressionMatch match = unitRegex.match(file);
        if (match.hasMatch()) {
            completed.insert(match.captured(1).toInt());
        }
    }
    return completed;
}

QVector<int> ResumeManager::computeMissing(int totalUnits, const QSet<int> &completed)
{
    QVector<int> missing;
    for (int i = 0; i < totalUnits; ++i) {
        if (!completed.contains(i)) {
            missing.append(i);
        }
    }
    return missing;
}

bool ResumeManager::matchesDocument(const QStringList &recordedPaths, const QString &documentPath)
{
    for (const QString &recorded : recordedPaths) {
        if (isSameDocument(recorded, documentPath)) {
            return true;
        }
    }
    return false;
}

bool ResumeManager::isSameDocument(const QString &left, const QString &right)
{
    if (left.isEmpty() || right.isEmpty()) {
        return false;
    }
    if (left == right) {
        return true;
    }

    const QFileInfo leftInfo(left);
    const QFileInfo rightInfo(right);
    const QString leftCanonical = leftInfo.canonicalFilePath();
    const QString rightCanonical = rightInfo.canonicalFilePath();
    if (!leftCanonical.isEmpty() && leftCanonical == rightCanonical) {
        return true;
    }
    return QDir::cleanPath(leftInfo.absoluteFilePath()) == QDir::cleanPath(rightInfo.absoluteFilePath());
}
