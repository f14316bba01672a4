#include "audioenhancer.h"

#include <QFileInfo>
#include <QRegularExpression>

#include "../../Core/processtreekiller.h"
#include "../Engine/enginecommandbuilder.h"

AudioEnhancer::AudioEnhancer(const EnhancementSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::MergedChannels);

    connect(m_process, &QProcess::readyReadStandardOutput,
            this, &AudioEnhancer::onReadyReadOutput);
    connect(m_process, static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished),
            this, &AudioEnhancer::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred,
            this, &AudioEnhancer::onProcessErrorOccurred);
}

AudioEnhancer::~AudioEnhancer()
{
    if (m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        if (!ProcessTreeKiller::terminateProcessTree(m_process->processId())) {
            m_process->kill();
        }
        m_process->waitForFinished(1000);
    }
}

bool AudioEnhancer::isRunning() const
{
    return !m_finished;
}

void AudioEnhancer::startEnhancement(const QString &filePath)
{
    if (isRunning()) {
        return;
    }

    m_filePath = filePath;
    m_stdoutBuffer.clear();
    m_outputTail.clear();
    m_lastPercent = -1;
    m_cancelRequested = false;
    m_finished = false;

    if (m_settings.program.isEmpty() || !QFileInfo::exists(filePath)) {
        const QString message = m_settings.program.isEmpty()
                                    ? QStringLiteral("未配置音质增强程序。")
                                    : QStringLiteral("待增强的成品不存在：%1").arg(filePath);
        finish(false, CoordinatorError::make(CoordinatorErrorKind::PostProcessing, message));
        return;
    }

    const QStringList args = QStringList(m_settings.args) << filePath;
    emit taskLog(QStringLiteral("开始音质增强..."));
    emit taskLog(QStringLiteral("命令：%1 %2").arg(m_settings.program, args.join(' ')));

    m_process->setProcessEnvironment(EngineCommandBuilder::engineEnvironment());
    m_process->start(m_settings.program, args);
}

void AudioEnhancer::cancel()
{
    if (!isRunning()) {
        return;
    }

    m_cancelRequested = true;
    emit taskLog(QStringLiteral("正在取消音质增强..."));

    if (m_process->state() != QProcess::NotRunning) {
        QString killError;
        if (!ProcessTreeKiller::terminateProcessTree(m_process->processId(), &killError)) {
            emit taskLog(killError);
        }
        m_process->kill();
        m_process->waitForFinished(1000);
    }
    finish(false, CoordinatorError::make(CoordinatorErrorKind::Cancelled, QStringLiteral("音质增强已取消。")));
}

int AudioEnhancer::parsePercent(const QString &line)
{
    static const QRegularExpression percentPattern(QStringLiteral("(\\d{1,3})%\\|"));
    const QRegularExpressionMatch match = percentPattern.match(line);
    if (!match.hasMatch()) {
        return -1;
    }
    return qBound(0, match.captured(1).toInt(), 100);
}

void AudioEnhancer::onReadyReadOutput()
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

void AudioEnhancer::processOutputLine(const QString &line)
{
    emit taskLog(line);
    const int percent = parsePercent(line);
    if (percent >= 0 && percent != m_lastPercent) {
        m_lastPercent = percent;
        emit progressChanged(percent);
    }
}

void AudioEnhancer::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (m_process->bytesAvailable() > 0) {
        onReadyReadOutput();
    }
    if (!m_stdoutBuffer.trimmed().isEmpty()) {
        processOutputLine(m_stdoutBuffer.trimmed());
    }
    m_stdoutBuffer.clear();

    if (m_finished) {
        return;
    }

    if (m_cancelRequested) {
        finish(false, CoordinatorError::make(CoordinatorErrorKind::Cancelled, QStringLiteral("音质增强已取消。")));
        return;
    }

    if (exitStatus != QProcess::NormalExit || exitCode != 0) {
        finish(false, CoordinatorError::make(CoordinatorErrorKind::PostProcessing,
                                             QStringLiteral("音质增强失败，退出码：%1").arg(exitCode),
                                             m_outputTail, exitCode));
        return;
    }

    finish(true, CoordinatorError());
}

void AudioEnhancer::onProcessErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart || m_finished) {
        return;
    }

    finish(false, CoordinatorError::make(CoordinatorErrorKind::PostProcessing,
                                         QStringLiteral("音质增强程序启动失败：%1").arg(m_process->errorString())));
}

void AudioEnhancer::finish(bool success, const CoordinatorError &error)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    emit enhancementFinished(success, m_filePath, error);
}
