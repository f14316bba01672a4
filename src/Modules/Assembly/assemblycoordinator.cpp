#include "assemblycoordinator.h"

#include <QFileInfo>

#include "../../Core/processtreekiller.h"
#include "../Engine/enginecommandbuilder.h"
#include "outputrelocator.h"

AssemblyCoordinator::AssemblyCoordinator(const CoordinatorSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::MergedChannels);

    connect(m_process, &QProcess::readyReadStandardOutput,
            this, &AssemblyCoordinator::onReadyReadOutput);
    connect(m_process, static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished),
            this, &AssemblyCoordinator::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred,
            this, &AssemblyCoordinator::onProcessErrorOccurred);
}

AssemblyCoordinator::~AssemblyCoordinator()
{
    if (m_tagger) {
        m_tagger->disconnect(this);
    }
    if (m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        if (!ProcessTreeKiller::terminateProcessTree(m_process->processId())) {
            m_process->kill();
        }
        m_process->waitForFinished(1000);
    }
}

bool AssemblyCoordinator::isRunning() const
{
    return !m_finished;
}

void AssemblyCoordinator::startAssembly(const AssemblyRequest &request)
{
    if (isRunning()) {
        return;
    }

    m_request = request;
    m_parser = AssemblyOutputParser(request.totalChapters, m_settings.outputExtension);
    m_stdoutBuffer.clear();
    m_outputTail.clear();
    m_outputPath.clear();
    m_postStep = PostStep::None;
    m_cancelRequested = false;
    m_finished = false;

    const QStringList args = EngineCommandBuilder::buildAssemblyArgs(m_settings.engine,
                                                                     request.documentPath,
                                                                     request.outputDir,
                                                                     request.sessionId,
                                                                     request.engine);

    emit taskLog(QStringLiteral("开始合成有声书..."));
    emit taskLog(QStringLiteral("命令：%1 %2").arg(m_settings.engine.program, args.join(' ')));
    emit progressChanged(m_parser.snapshot());

    m_process->setProcessEnvironment(EngineCommandBuilder::engineEnvironment());
    if (!m_settings.engine.workingDirectory.isEmpty()) {
        m_process->setWorkingDirectory(m_settings.engine.workingDirectory);
    }
    m_process->start(m_settings.engine.program, args);
}

void AssemblyCoordinator::cancel()
{
    if (!isRunning()) {
        return;
    }

    m_cancelRequested = true;
    emit taskLog(QStringLiteral("正在取消合成..."));

    if (m_process->state() != QProcess::NotRunning) {
        QString killError;
        if (!ProcessTreeKiller::terminateProcessTree(m_process->processId(), &killError)) {
            emit taskLog(killError);
        }
        m_process->kill();
        m_process->waitForFinished(1000);
    }
    if (m_tagger && m_tagger->isRunning()) {
        m_tagger->cancel();
    }

    // 进程已退出但结束信号尚未送达时也立即结束
    finish(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Cancelled, QStringLiteral("合成已取消。")));
}

AssemblyProgress AssemblyCoordinator::currentProgress() const
{
    return m_parser.snapshot();
}

void AssemblyCoordinator::onReadyReadOutput()
{
    const QString chunk = QString::fromUtf8(m_process->readAllStandardOutput());
    m_outputTail = boundedOutputTail(m_outputTail + chunk);
    m_stdoutBuffer += chunk;
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

void AssemblyCoordinator::processOutputLine(const QString &line)
{
    emit taskLog(line);
    if (m_parser.processLine(line)) {
        emit progressChanged(m_parser.snapshot());
    }
}

void AssemblyCoordinator::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (!m_stdoutBuffer.trimmed().isEmpty()) {
        processOutputLine(m_stdoutBuffer.trimmed());
    }
    m_stdoutBuffer.clear();

    if (m_finished) {
        return;
    }

    if (m_cancelRequested) {
        finish(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Cancelled, QStringLiteral("合成已取消。")));
        return;
    }

    const bool normalSuccess = (exitStatus == QProcess::NormalExit && exitCode == 0);
    const QString outputPath = locateOutput();

    if (outputPath.isEmpty()) {
        const QString message = normalSuccess
                                    ? QStringLiteral("合成完成但未找到成品文件。")
                                    : QStringLiteral("合成失败，退出码：%1").arg(exitCode);
        finish(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Assembly, message, m_outputTail, exitCode));
        return;
    }

    if (!normalSuccess) {
        emit taskLog(QStringLiteral("合成进程退出码 %1，但已找到成品：%2").arg(exitCode).arg(outputPath));
    }

    beginPostProcessing(outputPath);
}

void AssemblyCoordinator::onProcessErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart || m_finished) {
        return;
    }

    finish(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Assembly,
                                                    QStringLiteral("合成进程启动失败：%1").arg(m_process->errorString())));
}

QString AssemblyCoordinator::locateOutput() const
{
    const QString detected = m_parser.detectedOutputPath();
    if (!detected.isEmpty() && QFileInfo::exists(detected)) {
        return detected;
    }
    return OutputRelocator::findLatestOutput(m_request.outputDir, m_settings.outputExtension);
}

void AssemblyCoordinator::beginPostProcessing(const QString &outputPath)
{
    m_outputPath = outputPath;
    if (m_request.metadata.isEmpty()) {
        finish(true, outputPath, CoordinatorError());
        return;
    }

    m_parser.enterMetadataPhase(0);
    emit progressChanged(m_parser.snapshot());

    if (m_tagger) {
        m_tagger->disconnect(this);
        m_tagger->deleteLater();
    }
    m_tagger = new MetadataTagger(MetadataTagger::resolveTool(m_settings.metadataTool, m_settings.metadataToolPath),
                                  m_settings.metadataTimeoutMs, this);
    connect(m_tagger, &MetadataTagger::finished, this, &AssemblyCoordinator::onTaggerFinished);

    // 引擎会自动嵌入提取的封面，先去掉，只保留调用方指定的封面
    m_postStep = PostStep::RemoveCover;
    QString coverError;
    if (!m_tagger->startRemoveCover(outputPath, &coverError)) {
        emit taskLog(QStringLiteral("去除封面失败（可能不存在）：%1").arg(coverError));
        startApplyMetadataStep();
    }
}

void AssemblyCoordinator::startApplyMetadataStep()
{
    m_postStep = PostStep::ApplyMetadata;
    QString tagError;
    if (!m_tagger->startApplyMetadata(m_outputPath, m_request.metadata, &tagError)) {
        emit taskLog(QStringLiteral("后处理失败，保留原文件：%1").arg(tagError));
        finish(true, m_outputPath, CoordinatorError());
    }
}

void AssemblyCoordinator::onTaggerFinished(bool success, const QString &errorMessage)
{
    if (m_finished) {
        return;
    }
    if (m_cancelRequested) {
        finish(false, QString(), CoordinatorError::make(CoordinatorErrorKind::Cancelled, QStringLiteral("合成已取消。")));
        return;
    }

    if (m_postStep == PostStep::RemoveCover) {
        if (!success) {
            emit taskLog(QStringLiteral("去除封面失败（可能不存在）：%1").arg(errorMessage));
        }
        startApplyMetadataStep();
        return;
    }

    if (!success) {
        emit taskLog(QStringLiteral("后处理失败，保留原文件：%1").arg(errorMessage));
        finish(true, m_outputPath, CoordinatorError());
        return;
    }
    relocateAndFinish();
}

void AssemblyCoordinator::relocateAndFinish()
{
    m_postStep = PostStep::None;
    m_parser.enterMetadataPhase(50);
    emit progressChanged(m_parser.snapshot());

    QString finalPath = m_outputPath;
    QString relocateError;
    if (!OutputRelocator::relocate(m_outputPath, m_request.outputDir, m_request.metadata.outputFilename,
                                   &finalPath, &relocateError, m_settings.outputExtension)) {
        emit taskLog(QStringLiteral("后处理失败，保留原文件：%1").arg(relocateError));
        finish(true, m_outputPath, CoordinatorError());
        return;
    }
    if (!relocateError.isEmpty()) {
        emit taskLog(relocateError);
    }

    m_parser.enterMetadataPhase(100);
    emit progressChanged(m_parser.snapshot());
    if (finalPath != m_outputPath) {
        emit taskLog(QStringLiteral("成品已移动到：%1").arg(finalPath));
    }
    finish(true, finalPath, CoordinatorError());
}

void AssemblyCoordinator::finish(bool success, const QString &outputPath, const CoordinatorError &error)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    emit assemblyFinished(success, outputPath, error);
}
