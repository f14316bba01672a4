#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <QUuid>

#include "Core/conversiontypes.h"
#include "Core/coordinatorsettings.h"
#include "Core/workercountadvisor.h"
#include "Service/coordinatorservice.h"

namespace {

enum ExitCode
{
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printLine(QTextStream &stream, const QString &text)
{
    stream << text << '\n';
    stream.flush();
}

void printJson(const QJsonObject &obj)
{
    out() << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    out().flush();
}

struct CliOptions
{
    QCommandLineOption outputDir{QStringList() << QStringLiteral("o") << QStringLiteral("output-dir"),
                                 QStringLiteral("Directory for the finished audiobook."), QStringLiteral("dir")};
    QCommandLineOption workers{QStringList() << QStringLiteral("w") << QStringLiteral("workers"),
                               QStringLiteral("Number of parallel workers, or \"auto\"."), QStringLiteral("n"),
                               QStringLiteral("auto")};
    QCommandLineOption mode{QStringLiteral("mode"),
                            QStringLiteral("Partition by \"sentences\" or \"chapters\"."), QStringLiteral("mode"),
                            QStringLiteral("sentences")};
    QCommandLineOption device{QStringLiteral("device"), QStringLiteral("gpu, mps or cpu."), QStringLiteral("device"),
                              QStringLiteral("cpu")};
    QCommandLineOption language{QStringLiteral("language"), QStringLiteral("Document language code."),
                                QStringLiteral("code"), QStringLiteral("en")};
    QCommandLineOption engine{QStringLiteral("engine"), QStringLiteral("TTS engine name."), QStringLiteral("name"),
                              QStringLiteral("xtts")};
    QCommandLineOption voice{QStringLiteral("voice"), QStringLiteral("Fine-tuned voice model."), QStringLiteral("name")};
    QCommandLineOption textSplitting{QStringLiteral("text-splitting"), QStringLiteral("Let the engine split long sentences.")};
    QCommandLineOption title{QStringLiteral("title"), QStringLiteral("Title tag."), QStringLiteral("text")};
    QCommandLineOption author{QStringLiteral("author"), QStringLiteral("Author tag."), QStringLiteral("text")};
    QCommandLineOption year{QStringLiteral("year"), QStringLiteral("Year tag."), QStringLiteral("year")};
    QCommandLineOption cover{QStringLiteral("cover"), QStringLiteral("Cover image."), QStringLiteral("file")};
    QCommandLineOption outputName{QStringLiteral("output-name"), QStringLiteral("File name of the finished audiobook."),
                                  QStringLiteral("name")};
    QCommandLineOption session{QStringLiteral("session"), QStringLiteral("Explicit session id for resume/check."),
                               QStringLiteral("id")};
    QCommandLineOption config{QStringLiteral("config"), QStringLiteral("INI configuration file."), QStringLiteral("file")};
    QCommandLineOption verbose{QStringLiteral("verbose"), QStringLiteral("Echo raw worker output.")};

    void addTo(QCommandLineParser &parser) const
    {
        parser.addOptions({outputDir, workers, mode, device, language, engine, voice, textSplitting,
                           title, author, year, cover, outputName, session, config, verbose});
    }
};

bool buildConfig(const QCommandLineParser &parser, const CliOptions &options, const QString &documentPath,
                 ConversionConfig *config, QString *errorMessage)
{
    const QString workers = parser.value(options.workers).trimmed();
    if (workers.compare(QStringLiteral("auto"), Qt::CaseInsensitive) == 0) {
        const WorkerCountRecommendation recommendation = WorkerCountAdvisor::recommendForThisMachine();
        config->workerCount = recommendation.count;
        printLine(err(), QStringLiteral("Using %1 workers (%2)").arg(recommendation.count).arg(recommendation.reason));
    } else {
        bool ok = false;
        config->workerCount = workers.toInt(&ok);
        if (!ok || config->workerCount < 1) {
            *errorMessage = QStringLiteral("Invalid worker count: %1").arg(workers);
            return false;
        }
    }

    bool modeOk = false;
    config->partitionMode = partitionModeFromName(parser.value(options.mode), &modeOk);
    if (!modeOk) {
        *errorMessage = QStringLiteral("Invalid partition mode: %1").arg(parser.value(options.mode));
        return false;
    }

    const QString device = parser.value(options.device).toLower();
    if (device != QLatin1String("gpu") && device != QLatin1String("mps") && device != QLatin1String("cpu")) {
        *errorMessage = QStringLiteral("Invalid device: %1").arg(device);
        return false;
    }

    config->documentPath = QFileInfo(documentPath).absoluteFilePath();
    config->outputDir = parser.isSet(options.outputDir)
                            ? QFileInfo(parser.value(options.outputDir)).absoluteFilePath()
                            : QDir::currentPath();
    config->engine.device = device;
    config->engine.language = parser.value(options.language);
    config->engine.ttsEngine = parser.value(options.engine);
    config->engine.fineTuned = parser.value(options.voice);
    config->engine.enableTextSplitting = parser.isSet(options.textSplitting);
    config->metadata.title = parser.value(options.title);
    config->metadata.author = parser.value(options.author);
    config->metadata.year = parser.value(options.year);
    config->metadata.coverPath = parser.value(options.cover);
    config->metadata.outputFilename = parser.value(options.outputName);
    return true;
}

void attachConsole(CoordinatorService *service, bool verbose)
{
    QObject::connect(service, &CoordinatorService::logLine, service, [](const QString &line) {
        printLine(err(), line);
    });

    QObject::connect(service, &CoordinatorService::progressChanged, service,
                     [](const QString &jobId, const AggregatedProgress &progress) {
                         Q_UNUSED(jobId)
                         static QString lastLine;
                         QString line = QStringLiteral("%1 %2% %3/%4 %5")
                                            .arg(conversionPhaseName(progress.phase))
                                            .arg(progress.percentage)
                                            .arg(progress.completedUnits)
                                            .arg(progress.totalUnits)
                                            .arg(progress.message);
                         if (progress.hasEstimate()) {
                             line += QStringLiteral(" ETA %1s").arg(progress.estimatedRemainingSeconds);
                         }
                         if (line != lastLine) {
                             lastLine = line;
                             printLine(err(), line);
                         }
                     });

    if (verbose) {
        QObject::connect(service, &CoordinatorService::workerOutput, service,
                         [](const QString &jobId, int workerId, const QString &line) {
                             Q_UNUSED(jobId)
                             printLine(err(), QStringLiteral("[worker %1] %2").arg(workerId).arg(line));
                         });
    }

    // 排队连接：任务可能在 exec() 之前就同步结束
    QObject::connect(service, &CoordinatorService::conversionFinished, service,
                     [](const QString &jobId, const ConversionResult &result) {
                         Q_UNUSED(jobId)
                         printJson(result.toJson());
                         QCoreApplication::exit(result.success ? ExitSuccess : ExitFailure);
                     },
                     Qt::QueuedConnection);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("qTtsPool"));
    QCoreApplication::setApplicationName(QStringLiteral("qTtsPool"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Parallel audiobook conversion coordinator."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("convert | resume | check | sessions | recommend"));
    parser.addPositionalArgument(QStringLiteral("document"), QStringLiteral("Source document (EPUB)."), QStringLiteral("[document]"));

    const CliOptions options;
    options.addTo(parser);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        printLine(err(), parser.helpText());
        return ExitUsage;
    }
    const QString command = positional.first().toLower();

    if (command == QLatin1String("recommend")) {
        const WorkerCountRecommendation recommendation = WorkerCountAdvisor::recommendForThisMachine();
        printLine(out(), QStringLiteral("%1 (%2)").arg(recommendation.count).arg(recommendation.reason));
        return ExitSuccess;
    }

    CoordinatorSettings settings;
    if (parser.isSet(options.config)) {
        bool ok = false;
        QString configError;
        settings = CoordinatorSettings::loadFromFile(parser.value(options.config), &configError, &ok);
        if (!ok) {
            printLine(err(), configError);
            return ExitUsage;
        }
    } else {
        settings = CoordinatorSettings::loadDefault();
    }

    CoordinatorService service(settings);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &service, &CoordinatorService::stopAll);

    if (command == QLatin1String("sessions")) {
        QJsonArray sessions;
        for (const ResumeCheckResult &result : service.listResumableSessions()) {
            sessions.append(result.toJson());
        }
        printLine(out(), QString::fromUtf8(QJsonDocument(sessions).toJson(QJsonDocument::Indented)));
        return ExitSuccess;
    }

    if (positional.size() < 2) {
        printLine(err(), QStringLiteral("Missing document argument for \"%1\".").arg(command));
        return ExitUsage;
    }
    const QString documentPath = QFileInfo(positional.at(1)).absoluteFilePath();

    if (command == QLatin1String("check")) {
        const ResumeCheckResult result = service.checkResumeStatus(documentPath, parser.value(options.session));
        printJson(result.toJson());
        return result.success ? ExitSuccess : ExitFailure;
    }

    if (command != QLatin1String("convert") && command != QLatin1String("resume")) {
        printLine(err(), QStringLiteral("Unknown command: %1").arg(command));
        return ExitUsage;
    }

    ConversionConfig config;
    QString configError;
    if (!buildConfig(parser, options, documentPath, &config, &configError)) {
        printLine(err(), configError);
        return ExitUsage;
    }

    attachConsole(&service, parser.isSet(options.verbose));
    const QString jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QString startError;

    if (command == QLatin1String("convert")) {
        if (!service.startConversion(jobId, config, &startError)) {
            printLine(err(), startError);
            return ExitFailure;
        }
    } else {
        const ResumeCheckResult evidence = service.checkResumeStatus(documentPath, parser.value(options.session));
        if (!evidence.success) {
            printLine(err(), evidence.error);
            return ExitFailure;
        }
        if (!evidence.canResume && !evidence.complete) {
            printLine(err(), QStringLiteral("Session %1 has no converted sentences, start a new conversion instead.")
                         .arg(evidence.sessionId));
            return ExitFailure;
        }
        if (!service.resumeConversion(jobId, config, evidence, &startError)) {
            printLine(err(), startError);
            return ExitFailure;
        }
    }

    return app.exec();
}
