#include "coordinatorsettings.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

QString EngineLaunchSettings::resolvedSessionsRoot() const
{
    if (!sessionsRoot.trimmed().isEmpty()) {
        return QDir::cleanPath(sessionsRoot.trimmed());
    }

    const QString baseDir = workingDirectory.trimmed().isEmpty() ? QDir::currentPath() : workingDirectory.trimmed();
    return QDir(baseDir).filePath(QStringLiteral("tmp"));
}

QStringList EngineLaunchSettings::baseArguments() const
{
    QStringList args = prefixArgs;
    if (!script.trimmed().isEmpty()) {
        args << script.trimmed();
    }
    args << QStringLiteral("--headless");
    return args;
}

bool EnhancementSettings::appliesTo(const QString &ttsEngine) const
{
    if (!enabled || program.isEmpty()) {
        return false;
    }
    return engines.contains(ttsEngine.trimmed().toLower());
}

CoordinatorSettings CoordinatorSettings::load(QSettings &settings)
{
    CoordinatorSettings result;

    result.engine.program = settings.value(QStringLiteral("engine/program"), result.engine.program).toString().trimmed();
    result.engine.prefixArgs = settings.value(QStringLiteral("engine/prefixArgs"), result.engine.prefixArgs).toStringList();
    result.engine.script = settings.value(QStringLiteral("engine/script"), result.engine.script).toString().trimmed();
    result.engine.workingDirectory = settings.value(QStringLiteral("engine/workingDirectory")).toString().trimmed();
    result.engine.sessionsRoot = settings.value(QStringLiteral("engine/sessionsRoot")).toString().trimmed();

    result.metadataTool = settings.value(QStringLiteral("metadata/tool"), result.metadataTool).toString().trimmed().toLower();
    result.metadataToolPath = settings.value(QStringLiteral("metadata/path")).toString().trimmed();
    result.metadataTimeoutMs = settings.value(QStringLiteral("metadata/timeoutMs"), result.metadataTimeoutMs).toInt();

    result.enhancement.enabled = settings.value(QStringLiteral("enhance/enabled"), result.enhancement.enabled).toBool();
    result.enhancement.program = settings.value(QStringLiteral("enhance/program")).toString().trimmed();
    result.enhancement.args = settings.value(QStringLiteral("enhance/args"), result.enhancement.args).toStringList();
    result.enhancement.engines = settings.value(QStringLiteral("enhance/engines"), result.enhancement.engines).toStringList();

    result.outputExtension = settings.value(QStringLiteral("output/extension"), result.outputExtension).toString().trimmed();
    result.sentenceExtension = settings.value(QStringLiteral("output/sentenceExtension"), result.sentenceExtension).toString().trimmed();

    result.maxWorkerRetries = settings.value(QStringLiteral("workers/maxRetries"), result.maxWorkerRetries).toInt();

    result.watchdog.intervalMs = settings.value(QStringLiteral("watchdog/intervalMs"), result.watchdog.intervalMs).toInt();
    result.watchdog.startupTimeoutMs = settings.value(QStringLiteral("watchdog/startupTimeoutMs"), result.watchdog.startupTimeoutMs).toLongLong();
    result.watchdog.progressTimeoutMs = settings.value(QStringLiteral("watchdog/progressTimeoutMs"), result.watchdog.progressTimeoutMs).toLongLong();

    result.eta.windowMs = settings.value(QStringLiteral("eta/windowMs"), result.eta.windowMs).toLongLong();
    result.eta.minSamples = settings.value(QStringLiteral("eta/minSamples"), result.eta.minSamples).toInt();
    result.eta.minElapsedMs = settings.value(QStringLiteral("eta/minElapsedMs"), result.eta.minElapsedMs).toLongLong();
    result.eta.longHorizonWeight = settings.value(QStringLiteral("eta/longHorizonWeight"), result.eta.longHorizonWeight).toDouble();

    result.logsDirectory = settings.value(QStringLiteral("logging/directory")).toString().trimmed();

    result.normalize();
    return result;
}

CoordinatorSettings CoordinatorSettings::loadDefault()
{
    QSettings settings(QStringLiteral("qTtsPool"), QStringLiteral("qTtsPool"));
    return load(settings);
}

CoordinatorSettings CoordinatorSettings::loadFromFile(const QString &filePath, QString *errorMessage, bool *ok)
{
    if (ok) {
        *ok = false;
    }

    if (!QFileInfo::exists(filePath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("配置文件不存在：%1").arg(filePath);
        }
        return CoordinatorSettings();
    }

    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("配置文件格式错误：%1").arg(filePath);
        }
        return CoordinatorSettings();
    }

    if (ok) {
        *ok = true;
    }
    return load(settings);
}

void CoordinatorSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("engine/program"), engine.program);
    settings.setValue(QStringLiteral("engine/prefixArgs"), engine.prefixArgs);
    settings.setValue(QStringLiteral("engine/script"), engine.script);
    settings.setValue(QStringLiteral("engine/workingDirectory"), engine.workingDirectory);
    settings.setValue(QStringLiteral("engine/sessionsRoot"), engine.sessionsRoot);
    settings.setValue(QStringLiteral("metadata/tool"), metadataTool);
    settings.setValue(QStringLiteral("metadata/path"), metadataToolPath);
    settings.setValue(QStringLiteral("metadata/timeoutMs"), metadataTimeoutMs);
    settings.setValue(QStringLiteral("enhance/enabled"), enhancement.enabled);
    settings.setValue(QStringLiteral("enhance/program"), enhancement.program);
    settings.setValue(QStringLiteral("enhance/args"), enhancement.args);
    settings.setValue(QStringLiteral("enhance/engines"), enhancement.engines);
    settings.setValue(QStringLiteral("output/extension"), outputExtension);
    settings.setValue(QStringLiteral("output/sentenceExtension"), sentenceExtension);
    settings.setValue(QStringLiteral("workers/maxRetries"), maxWorkerRetries);
    settings.setValue(QStringLiteral("watchdog/intervalMs"), watchdog.intervalMs);
    settings.setValue(QStringLiteral("watchdog/startupTimeoutMs"), watchdog.startupTimeoutMs);
    settings.setValue(QStringLiteral("watchdog/progressTimeoutMs"), watchdog.progressTimeoutMs);
    settings.setValue(QStringLiteral("eta/windowMs"), eta.windowMs);
    settings.setValue(QStringLiteral("eta/minSamples"), eta.minSamples);
    settings.setValue(QStringLiteral("eta/minElapsedMs"), eta.minElapsedMs);
    settings.setValue(QStringLiteral("eta/longHorizonWeight"), eta.longHorizonWeight);
    settings.setValue(QStringLiteral("logging/directory"), logsDirectory);
    settings.sync();
}

QString CoordinatorSettings::resolvedLogsDirectory() const
{
    if (!logsDirectory.isEmpty()) {
        return QDir::cleanPath(logsDirectory);
    }
    return QDir(QDir::currentPath()).filePath(QStringLiteral("logs"));
}

void CoordinatorSettings::normalize()
{
    if (engine.program.isEmpty()) {
        engine.program = QStringLiteral("python");
    }
    if (metadataTool != QLatin1String("m4b-tool") && metadataTool != QLatin1String("tone")) {
        metadataTool = QStringLiteral("auto");
    }
    metadataTimeoutMs = qMax(1000, metadataTimeoutMs);

    QStringList engines;
    for (const QString &engineName : enhancement.engines) {
        const QString normalized = engineName.trimmed().toLower();
        if (!normalized.isEmpty() && !engines.contains(normalized)) {
            engines << normalized;
        }
    }
    enhancement.engines = engines;

    if (outputExtension.startsWith('.')) {
        outputExtension.remove(0, 1);
    }
    if (outputExtension.isEmpty()) {
        outputExtension = QStringLiteral("m4b");
    }
    if (sentenceExtension.startsWith('.')) {
        sentenceExtension.remove(0, 1);
    }
    if (sentenceExtension.isEmpty()) {
        sentenceExtension = QStringLiteral("flac");
    }

    maxWorkerRetries = qBound(0, maxWorkerRetries, 10);

    watchdog.intervalMs = qMax(100, watchdog.intervalMs);
    watchdog.startupTimeoutMs = qMax<qint64>(100, watchdog.startupTimeoutMs);
    watchdog.progressTimeoutMs = qMax<qint64>(100, watchdog.progressTimeoutMs);

    eta.windowMs = qMax<qint64>(100, eta.windowMs);
    eta.minSamples = qMax(2, eta.minSamples);
    eta.minElapsedMs = qMax<qint64>(0, eta.minElapsedMs);
    eta.minWindowSpanMs = qBound<qint64>(0, eta.minWindowSpanMs, eta.windowMs);
    eta.longHorizonWeight = qBound(0.0, eta.longHorizonWeight, 1.0);
}
