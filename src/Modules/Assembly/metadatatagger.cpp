#include "metadatatagger.h"

#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include "../../Core/processtreekiller.h"

namespace {

QStringList m4bToolCandidates()
{
    const QString homeDir = QDir::homePath();
#ifdef Q_OS_WIN
    return QStringList()
           << QDir(homeDir).filePath(QStringLiteral("scoop/shims/m4b-tool.bat"))
           << QDir(homeDir).filePath(QStringLiteral("scoop/apps/m4b-tool/current/m4b-tool.bat"))
           << QStringLiteral("C:/Program Files/m4b-tool/m4b-tool.bat")
           << QStringLiteral("C:/tools/m4b-tool/m4b-tool.bat");
#else
    return QStringList()
           << QStringLiteral("/opt/homebrew/bin/m4b-tool")
           << QStringLiteral("/usr/local/bin/m4b-tool")
           << QDir(homeDir).filePath(QStringLiteral(".local/bin/m4b-tool"));
#endif
}

QStringList toneCandidates()
{
    const QString homeDir = QDir::homePath();
#ifdef Q_OS_WIN
    return QStringList()
           << QDir(homeDir).filePath(QStringLiteral("tools/tone/tone.exe"))
           << QStringLiteral("C:/tools/tone/tone.exe")
           << QStringLiteral("C:/Program Files/tone/tone.exe")
           << QDir(homeDir).filePath(QStringLiteral("AppData/Local/tone/tone.exe"));
#else
    return QStringList()
           << QStringLiteral("/usr/local/bin/tone")
           << QDir(homeDir).filePath(QStringLiteral(".local/bin/tone"));
#endif
}

QString firstExisting(const QStringList &candidates, const QString &executableName)
{
    for (const QString &candidate : candidates) {
        if (QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
    return QStandardPaths::findExecutable(executableName);
}

} // namespace

QString MetadataToolInfo::name() const
{
    return kind == Kind::Tone ? QStringLiteral("tone") : QStringLiteral("m4b-tool");
}

MetadataTagger::MetadataTagger(const MetadataToolInfo &tool, int timeoutMs, QObject *parent)
    : QObject(parent)
    , m_tool(tool)
    , m_process(new QProcess(this))
    , m_timeoutTimer(new QTimer(this))
{
    m_process->setProcessChannelMode(QProcess::MergedChannels);
    m_timeoutTimer->setSingleShot(true);
    m_timeoutTimer->setInterval(timeoutMs);

    connect(m_process, static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished),
            this, &MetadataTagger::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred,
            this, &MetadataTagger::onProcessErrorOccurred);
    connect(m_timeoutTimer, &QTimer::timeout, this, &MetadataTagger::onTimeout);
}

MetadataTagger::~MetadataTagger()
{
    if (m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        stopProcess();
    }
}

const MetadataToolInfo &MetadataTagger::tool() const
{
    return m_tool;
}

MetadataToolInfo MetadataTagger::resolveTool(const QString &preferred, const QString &explicitPath)
{
    MetadataToolInfo info;
    const QString normalized = preferred.trimmed().toLower();

    if (!explicitPath.trimmed().isEmpty()) {
        info.path = explicitPath.trimmed();
        if (normalized == QLatin1String("tone")) {
            info.kind = MetadataToolInfo::Kind::Tone;
        } else if (normalized == QLatin1String("m4b-tool")) {
            info.kind = MetadataToolInfo::Kind::M4bTool;
        } else {
            info.kind = QFileInfo(info.path).baseName().toLower().startsWith(QLatin1String("tone"))
                            ? MetadataToolInfo::Kind::Tone
                            : MetadataToolInfo::Kind::M4bTool;
        }
        return info;
    }

    const QString m4bToolPath = firstExisting(m4bToolCandidates(), QStringLiteral("m4b-tool"));
    const QString tonePath = firstExisting(toneCandidates(), QStringLiteral("tone"));

    if (normalized == QLatin1String("tone")) {
        info.kind = MetadataToolInfo::Kind::Tone;
        info.path = tonePath;
        return info;
    }
    if (normalized == QLatin1String("m4b-tool")) {
        info.kind = MetadataToolInfo::Kind::M4bTool;
        info.path = m4bToolPath;
        return info;
    }

    // Windows 优先 tone（独立可执行文件），其他平台优先 m4b-tool
#ifdef Q_OS_WIN
    if (!tonePath.isEmpty()) {
        info.kind = MetadataToolInfo::Kind::Tone;
        info.path = tonePath;
    } else {
        info.kind = MetadataToolInfo::Kind::M4bTool;
        info.path = m4bToolPath;
    }
#else
    if (!m4bToolPath.isEmpty()) {
        info.kind = MetadataToolInfo::Kind::M4bTool;
        info.path = m4bToolPath;
    } else {
        info.kind = MetadataToolInfo::Kind::Tone;
        info.path = tonePath;
    }
#endif
    return info;
}

QStringList MetadataTagger::buildRemoveCoverArgs(MetadataToolInfo::Kind kind, const QString &filePath)
{
    if (kind == MetadataToolInfo::Kind::Tone) {
        return QStringList() << "tag" << "--meta-remove-property=EmbeddedPictures" << "--force" << filePath;
    }
    return QStringList() << "meta" << "--skip-cover" << "-f" << filePath;
}

QStringList MetadataTagger::buildApplyMetadataArgs(MetadataToolInfo::Kind kind,
                                                   const QString &filePath,
                                                   const OutputMetadata &metadata)
{
    const bool hasCover = !metadata.coverPath.isEmpty() && QFileInfo::exists(metadata.coverPath);
    if (metadata.title.isEmpty() && metadata.author.isEmpty() && metadata.year.isEmpty() && !hasCover) {
        return QStringList();
    }

    QStringList args;
    if (kind == MetadataToolInfo::Kind::Tone) {
        args << "tag";
        if (!metadata.title.isEmpty()) {
            args << "--meta-title" << metadata.title;
        }
        if (!metadata.author.isEmpty()) {
            args << "--meta-artist" << metadata.author;
        }
        if (!metadata.year.isEmpty()) {
            // tone 要求完整日期
            const QString date = metadata.year.contains('-') ? metadata.year : metadata.year + QStringLiteral("-01-01");
            args << "--meta-publishing-date" << date;
        }
        if (hasCover) {
            args << "--meta-cover-file" << metadata.coverPath;
        }
        args << "--force" << filePath;
        return args;
    }

    args << "meta";
    if (!metadata.title.isEmpty()) {
        args << "--name" << metadata.title;
    }
    if (!metadata.author.isEmpty()) {
        args << "--artist" << metadata.author;
    }
    if (!metadata.year.isEmpty()) {
        args << "--year" << metadata.year;
    }
    if (hasCover) {
        args << "--cover" << metadata.coverPath;
    }
    args << "-f" << filePath;
    return args;
}

bool MetadataTagger::isRunning() const
{
    return !m_finished;
}

bool MetadataTagger::startRemoveCover(const QString &filePath, QString *errorMessage)
{
    return startTool(buildRemoveCoverArgs(m_tool.kind, filePath), errorMessage);
}

bool MetadataTagger::startApplyMetadata(const QString &filePath, const OutputMetadata &metadata, QString *errorMessage)
{
    if (isRunning()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 正在运行。").arg(m_tool.name());
        }
        return false;
    }

    const QStringList args = buildApplyMetadataArgs(m_tool.kind, filePath, metadata);
    if (args.isEmpty()) {
        m_cancelRequested = false;
        m_finished = false;
        QTimer::singleShot(0, this, [this]() {
            finish(true, QString());
        });
        return true;
    }
    return startTool(args, errorMessage);
}

void MetadataTagger::cancel()
{
    if (!isRunning()) {
        return;
    }

    m_cancelRequested = true;
    if (m_process->state() == QProcess::NotRunning) {
        finish(false, QStringLiteral("%1 已取消。").arg(m_tool.name()));
        return;
    }
    stopProcess();
}

bool MetadataTagger::startTool(const QStringList &args, QString *errorMessage)
{
    if (!m_tool.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("未找到标签工具（m4b-tool 或 tone）。");
        }
        return false;
    }
    if (isRunning()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 正在运行。").arg(m_tool.name());
        }
        return false;
    }

    m_timedOut = false;
    m_cancelRequested = false;
    m_finished = false;
    m_process->start(m_tool.path, args);
    m_timeoutTimer->start();
    return true;
}

void MetadataTagger::stopProcess()
{
    if (!ProcessTreeKiller::terminateProcessTree(m_process->processId())) {
        m_process->kill();
    }
    m_process->waitForFinished(1000);
}

void MetadataTagger::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (m_finished) {
        return;
    }

    if (m_cancelRequested) {
        finish(false, QStringLiteral("%1 已取消。").arg(m_tool.name()));
        return;
    }
    if (m_timedOut) {
        finish(false, QStringLiteral("%1 执行超时。").arg(m_tool.name()));
        return;
    }

    if (exitStatus != QProcess::NormalExit || exitCode != 0) {
        finish(false, QStringLiteral("%1 执行失败，退出码：%2\n%3")
                          .arg(m_tool.name())
                          .arg(exitCode)
                          .arg(boundedOutputTail(QString::fromUtf8(m_process->readAll()))));
        return;
    }

    finish(true, QString());
}

void MetadataTagger::onProcessErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart || m_finished) {
        return;
    }
    finish(false, QStringLiteral("%1 启动失败：%2").arg(m_tool.name(), m_process->errorString()));
}

void MetadataTagger::onTimeout()
{
    if (m_finished || m_process->state() == QProcess::NotRunning) {
        return;
    }
    m_timedOut = true;
    stopProcess();
}

void MetadataTagger::finish(bool success, const QString &errorMessage)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_timeoutTimer->stop();
    emit finished(success, errorMessage);
}
