#include "sessionpreparer.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

#include <algorithm>

#include "../../Core/processtreekiller.h"
#include "enginecommandbuilder.h"

namespace {
const QString kStateFileName = QStringLiteral("session-state.json");
const QString kSessionDirPrefix = QStringLiteral("ebook-");

// 状态文件可解析为 JSON 对象且含 total_sentences
bool isUsableStateFile(const QString &statePath)
{
    QFile file(statePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    return doc.isObject() && doc.object().contains(QStringLiteral("total_sentences"));
}
}

SessionPreparer::SessionPreparer(const EngineLaunchSettings &launch, QObject *parent)
    : QObject(parent)
    , m_launch(launch)
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::MergedChannels);

    connect(m_process, &QProcess::readyReadStandardOutput,
            this, &SessionPreparer::onReadyReadOutput);
    connect(m_process, static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished),
            this, &SessionPreparer::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred,
            this, &SessionPreparer::onProcessErrorOccurred);
}

bool SessionPreparer::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

QString SessionPreparer::sessionId() const
{
    return m_sessionId;
}

void SessionPreparer::startPreparation(const QString &documentPath, const EngineSettings &engine)
{
    if (isRunning()) {
        return;
    }

    m_sessionId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    m_documentPath = documentPath;
    m_outputTail.clear();
    m_stdoutBuffer.clear();
    m_cancelRequested = false;
    m_finished = false;

    if (!QFileInfo::exists(documentPath)) {
        finishWithError(CoordinatorError::make(CoordinatorErrorKind::Preparation,
                                               QStringLiteral("源文档不存在：%1").arg(documentPath)));
        return;
    }

    const QStringList args = EngineCommandBuilder::buildPrepArgs(m_launch, documentPath, m_sessionId, engine);

    emit taskLog(QStringLiteral("开始预处理会话 %1").arg(m_sessionId));
    emit taskLog(QStringLiteral("命令：%1 %2").arg(m_launch.program, args.join(' ')));

    m_process->setProcessEnvironment(EngineCommandBuilder::engineEnvironment());
    if (!m_launch.workingDirectory.isEmpty()) {
        m_process->setWorkingDirectory(m_launch.workingDirectory);
    }
    m_process->start(m_launch.program, args);
    if (!m_process->waitForStarted(3000)) {
        finishWithError(CoordinatorError::make(CoordinatorErrorKind::Preparation,
                                               QStringLiteral("引擎预处理进程启动失败：%1").arg(m_process->errorString())));
        return;
    }

    emit preparationStarted(m_sessionId);
}

void SessionPreparer::cancel()
{
    if (!isRunning()) {
        return;
    }

    m_cancelRequested = true;
    emit taskLog(QStringLiteral("正在取消预处理..."));

    QString killError;
    if (!ProcessTreeKiller::terminateProcessTree(m_process->processId(), &killError)) {
        emit taskLog(killError);
    }
    m_process->kill();
    m_process->waitForFinished(1000);
}

void SessionPreparer::onReadyReadOutput()
{
    const QString chunk = QString::fromUtf8(m_process->readAllStandardOutput());
    m_outputTail = boundedOutputTail(m_outputTail + chunk);
    m_stdoutBuffer += chunk;

    int newlineIndex = m_stdoutBuffer.indexOf('\n');
    while (newlineIndex >= 0) {
        const QString line = m_stdoutBuffer.left(newlineIndex).trimmed();
        m_stdoutBuffer.remove(0, newlineIndex + 1);
        if (!line.isEmpty()) {
            emit taskLog(line);
        }
        newlineIndex = m_stdoutBuffer.indexOf('\n');
    }
}

void SessionPreparer::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (!m_stdoutBuffer.trimmed().isEmpty()) {
        emit taskLog(m_stdoutBuffer.trimmed());
    }
    m_stdoutBuffer.clear();

    if (m_finished) {
        return;
    }

    if (m_cancelRequested) {
        finishWithError(CoordinatorError::make(CoordinatorErrorKind::Cancelled, QStringLiteral("预处理已取消。")));
        return;
    }

    if (exitStatus != QProcess::NormalExit || exitCode != 0) {
        finishWithError(CoordinatorError::make(CoordinatorErrorKind::Preparation,
                                               QStringLiteral("预处理失败，退出码：%1").arg(exitCode),
                                               m_outputTail,
                                               exitCode));
        return;
    }

    PrepInfo info;
    QString readError;
    const QString sessionDir = sessionDirFor(m_launch.resolvedSessionsRoot(), m_sessionId);
    if (!readPrepInfo(sessionDir, &info, &readError)) {
        finishWithError(CoordinatorError::make(CoordinatorErrorKind::Preparation, readError, m_outputTail));
        return;
    }
    if (info.sourceDocumentPath.isEmpty()) {
        info.sourceDocumentPath = m_documentPath;
    }

    m_finished = true;
    emit taskLog(QStringLiteral("预处理完成：%1 句，%2 章").arg(info.totalUnits).arg(info.totalChapters));
    emit preparationFinished(true, info, CoordinatorError());
}

void SessionPreparer::onProcessErrorOccurred(QProcess::ProcessError error)
{
    if (m_cancelRequested || m_finished) {
        return;
    }

    // 进程已运行时的异常由 finished 统一处理
    if (error == QProcess::FailedToStart) {
        finishWithError(CoordinatorError::make(CoordinatorErrorKind::Preparation,
                                               QStringLiteral("引擎预处理进程启动失败：%1").arg(m_process->errorString())));
    }
}

void SessionPreparer::finishWithError(const CoordinatorError &error)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    emit taskLog(error.message);
    emit preparationFinished(false, PrepInfo(), error);
}

bool SessionPreparer::readPrepInfo(const QString &sessionDir, PrepInfo *info, QString *errorMessage)
{
    const QString processDir = findProcessDir(sessionDir);
    if (processDir.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("会话目录中没有找到处理目录：%1").arg(sessionDir);
        }
        return false;
    }

    const QString statePath = QDir(processDir).filePath(kStateFileName);
    QFile file(statePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("无法读取会话状态文件：%1").arg(statePath);
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("会话状态文件格式错误：%1").arg(parseError.errorString());
        }
        return false;
    }

    const QJsonObject state = doc.object();
    if (!state.contains(QStringLiteral("total_sentences"))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("会话状态文件缺少 total_sentences：%1").arg(statePath);
        }
        return false;
    }

    PrepInfo result;
    result.sessionId = state.value(QStringLiteral("session_id")).toString();
    if (result.sessionId.isEmpty()) {
        result.sessionId = sessionIdFromDirName(QFileInfo(sessionDir).fileName());
    }
    result.sessionDir = state.value(QStringLiteral("session_dir")).toString(QDir::cleanPath(sessionDir));
    result.processDir = state.value(QStringLiteral("process_dir")).toString(QDir::cleanPath(processDir));
    result.chaptersDir = state.value(QStringLiteral("chapters_dir")).toString(
        QDir(result.processDir).filePath(QStringLiteral("chapters")));
    result.sentencesDir = state.value(QStringLiteral("chapters_dir_sentences")).toString(
        QDir(result.chaptersDir).filePath(QStringLiteral("sentences")));
    result.engineDocumentPath = state.value(QStringLiteral("epub_path")).toString();
    result.sourceDocumentPath = state.value(QStringLiteral("source_epub_path")).toString(result.engineDocumentPath);
    result.totalUnits = qMax(0, state.value(QStringLiteral("total_sentences")).toInt());

    for (const QJsonValue &value : state.value(QStringLiteral("chapters")).toArray()) {
        result.chapters.append(ChapterBoundary::fromJson(value.toObject()));
    }
    result.totalChapters = state.value(QStringLiteral("total_chapters")).toInt(result.chapters.size());
    result.metadata = DocumentMetadata::fromJson(state.value(QStringLiteral("metadata")).toObject());

    if (info) {
        *info = result;
    }
    return true;
}

QString SessionPreparer::sessionDirFor(const QString &sessionsRoot, const QString &sessionId)
{
    return QDir(sessionsRoot).filePath(kSessionDirPrefix + sessionId);
}

QString SessionPreparer::findProcessDir(const QString &sessionDir)
{
    const QDir dir(sessionDir);
    if (!dir.exists()) {
        return QString();
    }

    QFileInfoList stateFiles;
    const QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo &entry : entries) {
        const QFileInfo stateFile(QDir(entry.absoluteFilePath()).filePath(kStateFileName));
        if (stateFile.isFile()) {
            stateFiles << stateFile;
        }
    }
    if (stateFiles.isEmpty()) {
        return QString();
    }

    // 重复尝试会留下多个处理目录：从最新的状态文件开始，取第一个可用的
    std::stable_sort(stateFiles.begin(), stateFiles.end(), [](const QFileInfo &a, const QFileInfo &b) {
        return a.lastModified() > b.lastModified();
    });
    for (const QFileInfo &stateFile : stateFiles) {
        if (isUsableStateFile(stateFile.absoluteFilePath())) {
            return stateFile.absolutePath();
        }
    }
    // 都不可用时返回最新的一个，由 readPrepInfo 报告具体原因
    return stateFiles.first().absolutePath();
}

QString SessionPreparer::sessionIdFromDirName(const QString &dirName)
{
    return dirName.startsWith(kSessionDirPrefix) ? dirName.mid(kSessionDirPrefix.size()) : dirName;
}
