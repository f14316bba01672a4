#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "Core/joblogger.h"
#include "Service/coordinatorservice.h"
#include "testsupport.h"

class CoordinatorServiceTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir_;
    QString sessionsRoot_;
    QString document_;
    QString outputDir_;

    void SetUp() override
    {
        sessionsRoot_ = QDir(tempDir_.path()).filePath(QStringLiteral("tmp"));
        document_ = QDir(tempDir_.path()).filePath(QStringLiteral("book.epub"));
        outputDir_ = QDir(tempDir_.path()).filePath(QStringLiteral("out"));
        testsupport::writeTextFile(document_, QByteArray("epub"));
    }

    CoordinatorSettings settingsFor(const testsupport::FakeEngineOptions &options) const
    {
        const QString script = testsupport::writeFakeEngine(tempDir_.path(), sessionsRoot_, options);
        return testsupport::fakeEngineSettings(script, sessionsRoot_,
                                               QDir(tempDir_.path()).filePath(QStringLiteral("logs")));
    }

    ConversionConfig configFor(int workerCount) const
    {
        ConversionConfig config;
        config.workerCount = workerCount;
        config.documentPath = document_;
        config.outputDir = outputDir_;
        return config;
    }

    // 运行到 conversionFinished 并返回结果
    static bool runToFinish(CoordinatorService &service, const QString &jobId, ConversionResult *result,
                            int timeoutMs = 15000)
    {
        bool finished = false;
        const QMetaObject::Connection connection = QObject::connect(
            &service, &CoordinatorService::conversionFinished,
            [&](const QString &finishedJob, const ConversionResult &value) {
                if (finishedJob == jobId) {
                    finished = true;
                    *result = value;
                }
            });
        const bool ok = testsupport::waitUntil([&finished]() { return finished; }, timeoutMs);
        QObject::disconnect(connection);
        return ok;
    }

    static QString summaryStatus(const CoordinatorService &service, const QString &jobId)
    {
        const QJsonArray summaries = service.logger()->readSummaries();
        for (const QJsonValue &value : summaries) {
            const QJsonObject summary = value.toObject();
            if (summary.value(QStringLiteral("jobId")).toString() == jobId) {
                return summary.value(QStringLiteral("status")).toString();
            }
        }
        return QString();
    }
};

TEST_F(CoordinatorServiceTest, FreshConversionSucceeds) {
    CoordinatorService service(settingsFor(testsupport::FakeEngineOptions()));
    QVector<AggregatedProgress> updates;
    QObject::connect(&service, &CoordinatorService::progressChanged,
                     [&updates](const QString &, const AggregatedProgress &progress) { updates << progress; });

    QString error;
    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(2), &error)) << error.toStdString();
    EXPECT_TRUE(service.isConversionActive(QStringLiteral("job1")));
    EXPECT_EQ(service.activeJobs(), QStringList{QStringLiteral("job1")});

    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success) << result.error.message.toStdString();
    EXPECT_EQ(result.outputPath, QDir(outputDir_).filePath(QStringLiteral("Fake_Book.m4b")));
    EXPECT_TRUE(QFileInfo::exists(result.outputPath));
    EXPECT_EQ(result.failedWorkers, 0);
    EXPECT_EQ(result.analytics.totalUnits, 8);
    EXPECT_EQ(result.analytics.totalChapters, 2);
    EXPECT_EQ(result.analytics.workerCount, 2);
    EXPECT_EQ(result.analytics.unitsProcessedInSession, 8);
    EXPECT_FALSE(result.analytics.isResume);

    ASSERT_FALSE(updates.isEmpty());
    EXPECT_EQ(updates.first().phase, ConversionPhase::Preparing);
    EXPECT_EQ(updates.last().phase, ConversionPhase::Complete);
    EXPECT_EQ(updates.last().percentage, 100);
    bool sawAssembling = false;
    for (int i = 1; i < updates.size(); ++i) {
        EXPECT_GE(static_cast<int>(updates[i].phase), static_cast<int>(updates[i - 1].phase));
        if (updates[i].phase == ConversionPhase::Assembling) {
            sawAssembling = true;
        }
    }
    EXPECT_TRUE(sawAssembling);

    EXPECT_FALSE(service.isConversionActive(QStringLiteral("job1")));
    AggregatedProgress snapshot;
    EXPECT_FALSE(service.progress(QStringLiteral("job1"), &snapshot));
    EXPECT_EQ(summaryStatus(service, QStringLiteral("job1")), QStringLiteral("completed"));
}

TEST_F(CoordinatorServiceTest, WorkerOutputIsForwarded) {
    CoordinatorService service(settingsFor(testsupport::FakeEngineOptions()));
    QStringList lines;
    QObject::connect(&service, &CoordinatorService::workerOutput,
                     [&lines](const QString &jobId, int workerId, const QString &line) {
                         EXPECT_EQ(jobId, QStringLiteral("job1"));
                         EXPECT_EQ(workerId, 0);
                         lines << line;
                     });

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(lines.contains(QStringLiteral("Converting 100%: 8/8")));
}

TEST_F(CoordinatorServiceTest, PartialFailureStillAssembles) {
    testsupport::FakeEngineOptions options;
    options.failStart = 4;
    options.failTimes = 3;
    CoordinatorService service(settingsFor(options));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(2)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.failedWorkers, 1);
    EXPECT_EQ(result.analytics.failedWorkers, 1);
}

TEST_F(CoordinatorServiceTest, RetryRecoversTransientFailure) {
    testsupport::FakeEngineOptions options;
    options.failStart = 4;
    options.failTimes = 2;
    CoordinatorService service(settingsFor(options));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(2)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.failedWorkers, 0);
}

TEST_F(CoordinatorServiceTest, AllWorkersFailing) {
    testsupport::FakeEngineOptions options;
    options.failStart = 0;
    options.failTimes = 10;
    CoordinatorService service(settingsFor(options));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, CoordinatorErrorKind::PermanentWorkerFailure);
    EXPECT_EQ(result.failedWorkers, 1);
    EXPECT_EQ(summaryStatus(service, QStringLiteral("job1")), QStringLiteral("failed"));
}

TEST_F(CoordinatorServiceTest, PreparationFailure) {
    testsupport::FakeEngineOptions options;
    options.prepExitCode = 2;
    CoordinatorService service(settingsFor(options));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(2)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, CoordinatorErrorKind::Preparation);
}

TEST_F(CoordinatorServiceTest, AssemblyWithoutOutputFails) {
    testsupport::FakeEngineOptions options;
    options.assembleWritesOutput = false;
    CoordinatorService service(settingsFor(options));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, CoordinatorErrorKind::Assembly);
}

TEST_F(CoordinatorServiceTest, StalledWorkerIsRestarted) {
    testsupport::FakeEngineOptions options;
    options.hangStart = 0;
    options.hangTimes = 1;
    CoordinatorService service(settingsFor(options));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(2)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result, 20000));

    EXPECT_TRUE(result.success) << result.error.message.toStdString();
    EXPECT_EQ(result.failedWorkers, 0);
}

TEST_F(CoordinatorServiceTest, StopCancelsImmediately) {
    testsupport::FakeEngineOptions options;
    options.unitDelay = QStringLiteral("1");
    CoordinatorService service(settingsFor(options));

    bool finished = false;
    ConversionResult result;
    QObject::connect(&service, &CoordinatorService::conversionFinished,
                     [&](const QString &, const ConversionResult &value) {
                         finished = true;
                         result = value;
                     });

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(2)));
    ASSERT_TRUE(testsupport::waitUntil([&service]() {
        AggregatedProgress progress;
        return service.progress(QStringLiteral("job1"), &progress) && progress.completedUnits > 0;
    }));

    ASSERT_TRUE(service.stopConversion(QStringLiteral("job1")));
    EXPECT_TRUE(finished);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, CoordinatorErrorKind::Cancelled);
    EXPECT_TRUE(result.analytics.wasCancelled);
    EXPECT_GT(result.analytics.completedUnitsAtCancel, 0);
    EXPECT_EQ(result.failedWorkers, 0);
    EXPECT_FALSE(service.stopConversion(QStringLiteral("job1")));
    EXPECT_EQ(summaryStatus(service, QStringLiteral("job1")), QStringLiteral("cancelled"));
}

TEST_F(CoordinatorServiceTest, ValidatesRequests) {
    testsupport::FakeEngineOptions options;
    options.unitDelay = QStringLiteral("1");
    CoordinatorService service(settingsFor(options));
    QString error;

    ConversionConfig missing = configFor(1);
    missing.documentPath = QDir(tempDir_.path()).filePath(QStringLiteral("missing.epub"));
    EXPECT_FALSE(service.startConversion(QStringLiteral("job1"), missing, &error));
    EXPECT_FALSE(error.isEmpty());

    ConversionConfig noOutput = configFor(1);
    noOutput.outputDir.clear();
    error.clear();
    EXPECT_FALSE(service.startConversion(QStringLiteral("job1"), noOutput, &error));
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(service.startConversion(QString(), configFor(1)));

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    error.clear();
    EXPECT_FALSE(service.startConversion(QStringLiteral("job1"), configFor(1), &error));
    EXPECT_FALSE(error.isEmpty());

    service.stopAll();
    EXPECT_TRUE(service.activeJobs().isEmpty());
}

TEST_F(CoordinatorServiceTest, ResumeConvertsOnlyMissingUnits) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("resume1"), document_, 8, QVector<int>{0, 1, 2, 5});
    CoordinatorService service(settingsFor(testsupport::FakeEngineOptions()));

    const ResumeCheckResult check = service.checkResumeStatus(document_);
    ASSERT_TRUE(check.success) << check.error.toStdString();
    ASSERT_TRUE(check.canResume);
    EXPECT_EQ(check.sessionId, QStringLiteral("resume1"));
    EXPECT_EQ(check.missingIndices, (QVector<int>{3, 4, 6, 7}));

    const QVector<ResumeCheckResult> sessions = service.listResumableSessions();
    ASSERT_EQ(sessions.size(), 1);
    EXPECT_EQ(sessions.first().sessionId, QStringLiteral("resume1"));

    QStringList lines;
    QObject::connect(&service, &CoordinatorService::workerOutput,
                     [&lines](const QString &, int, const QString &line) { lines << line; });

    QString error;
    ASSERT_TRUE(service.resumeConversion(QStringLiteral("job1"), configFor(2), check, &error)) << error.toStdString();
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success) << result.error.message.toStdString();
    EXPECT_TRUE(result.analytics.isResume);
    EXPECT_EQ(result.analytics.unitsProcessedInSession, 4);
    EXPECT_TRUE(lines.contains(QStringLiteral("Recovering missing sentence 6")));
    EXPECT_FALSE(lines.contains(QStringLiteral("Recovering missing sentence 1")));

    const ResumeCheckResult after = service.checkResumeStatus(document_);
    EXPECT_TRUE(after.complete);
    EXPECT_TRUE(service.listResumableSessions().isEmpty());
}

TEST_F(CoordinatorServiceTest, ResumeOfCompleteSessionOnlyAssembles) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("done1"), document_, 4, QVector<int>{0, 1, 2, 3});
    CoordinatorService service(settingsFor(testsupport::FakeEngineOptions()));

    bool workerSpawned = false;
    QObject::connect(&service, &CoordinatorService::workerOutput,
                     [&workerSpawned](const QString &, int, const QString &) { workerSpawned = true; });

    const ResumeCheckResult check = service.checkResumeStatus(document_);
    ASSERT_TRUE(check.complete);
    ASSERT_TRUE(service.resumeConversion(QStringLiteral("job1"), configFor(2), check));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(workerSpawned);
    EXPECT_EQ(result.analytics.unitsProcessedInSession, 0);
}

TEST_F(CoordinatorServiceTest, ResumeRejectsIncompleteEvidence) {
    CoordinatorService service(settingsFor(testsupport::FakeEngineOptions()));
    ResumeCheckResult evidence;
    QString error;
    EXPECT_FALSE(service.resumeConversion(QStringLiteral("job1"), configFor(1), evidence, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(service.isConversionActive(QStringLiteral("job1")));
}

TEST_F(CoordinatorServiceTest, MetadataAndOutputName) {
    CoordinatorSettings settings = settingsFor(testsupport::FakeEngineOptions());
    const QString argsLog = QDir(tempDir_.path()).filePath(QStringLiteral("tagger-args.log"));
    settings.metadataTool = QStringLiteral("m4b-tool");
    settings.metadataToolPath = testsupport::writeFakeTagger(tempDir_.path(), argsLog);
    CoordinatorService service(settings);

    ConversionConfig config = configFor(1);
    config.metadata.title = QStringLiteral("My Book");
    config.metadata.author = QStringLiteral("Someone");
    config.metadata.outputFilename = QStringLiteral("My Book");

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), config));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success) << result.error.message.toStdString();
    EXPECT_EQ(result.outputPath, QDir(outputDir_).filePath(QStringLiteral("My Book.m4b")));
    EXPECT_TRUE(QFileInfo::exists(result.outputPath));
    EXPECT_FALSE(QFileInfo::exists(QDir(outputDir_).filePath(QStringLiteral("Fake_Book.m4b"))));

    QFile log(argsLog);
    ASSERT_TRUE(log.open(QIODevice::ReadOnly));
    const QString taggerArgs = QString::fromUtf8(log.readAll());
    EXPECT_TRUE(taggerArgs.contains(QStringLiteral("My Book")));
    EXPECT_TRUE(taggerArgs.contains(QStringLiteral("Someone")));
}

TEST_F(CoordinatorServiceTest, FailingTaggerKeepsEngineOutput) {
    CoordinatorSettings settings = settingsFor(testsupport::FakeEngineOptions());
    settings.metadataTool = QStringLiteral("m4b-tool");
    settings.metadataToolPath = testsupport::writeFakeTagger(
        tempDir_.path(), QDir(tempDir_.path()).filePath(QStringLiteral("args.log")), 1);
    CoordinatorService service(settings);

    ConversionConfig config = configFor(1);
    config.metadata.title = QStringLiteral("My Book");
    config.metadata.outputFilename = QStringLiteral("My Book");

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), config));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.outputPath, QDir(outputDir_).filePath(QStringLiteral("Fake_Book.m4b")));
}

TEST_F(CoordinatorServiceTest, PrepareSessionReportsInfo) {
    CoordinatorService service(settingsFor(testsupport::FakeEngineOptions()));
    bool done = false;
    bool succeeded = false;
    PrepInfo prepared;
    QObject::connect(&service, &CoordinatorService::sessionPrepared,
                     [&](bool success, const PrepInfo &info, const CoordinatorError &) {
                         done = true;
                         succeeded = success;
                         prepared = info;
                     });

    ASSERT_TRUE(service.prepareSession(document_, EngineSettings()));
    EXPECT_FALSE(service.prepareSession(document_, EngineSettings()));
    ASSERT_TRUE(testsupport::waitUntil([&done]() { return done; }));

    EXPECT_TRUE(succeeded);
    EXPECT_EQ(prepared.totalUnits, 8);
    EXPECT_EQ(prepared.chapters.size(), 2);
    EXPECT_EQ(prepared.metadata.title, QStringLiteral("Fake Book"));

    const ResumeCheckResult check = service.checkResumeStatus(document_, prepared.sessionId);
    EXPECT_TRUE(check.success);
    EXPECT_FALSE(check.canResume);
    EXPECT_EQ(check.completedUnits, 0);
}

TEST_F(CoordinatorServiceTest, StallRetriesExhaustedFailPermanently) {
    testsupport::FakeEngineOptions options;
    options.hangStart = 0;
    options.hangTimes = 5;
    CoordinatorService service(settingsFor(options));
    QVector<AggregatedProgress> updates;
    QObject::connect(&service, &CoordinatorService::progressChanged,
                     [&updates](const QString &, const AggregatedProgress &progress) { updates << progress; });

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result, 25000));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, CoordinatorErrorKind::PermanentWorkerFailure);
    EXPECT_EQ(result.failedWorkers, 1);

    // 首次运行加两次重试，共启动三次
    QFile counter(QDir(tempDir_.path()).filePath(QStringLiteral("engine-state/hang-0")));
    ASSERT_TRUE(counter.open(QIODevice::ReadOnly));
    EXPECT_EQ(counter.readAll().trimmed(), QByteArray("3"));

    ASSERT_FALSE(updates.isEmpty());
    ASSERT_EQ(updates.last().workers.size(), 1);
    const WorkerState &worker = updates.last().workers.first();
    EXPECT_EQ(worker.retryCount, 2);
    EXPECT_TRUE(worker.permanentlyFailed);
    EXPECT_EQ(worker.status, WorkerStatus::Error);
    EXPECT_EQ(worker.failureReason, WorkerFailureReason::Stalled);
}

TEST_F(CoordinatorServiceTest, EnhancementRunsAfterAssembly) {
    CoordinatorSettings settings = settingsFor(testsupport::FakeEngineOptions());
    settings.enhancement.enabled = true;
    settings.enhancement.program = testsupport::writeFakeEnhancer(tempDir_.path());
    settings.enhancement.engines = QStringList{QStringLiteral("xtts")};
    CoordinatorService service(settings);
    QVector<AggregatedProgress> updates;
    QObject::connect(&service, &CoordinatorService::progressChanged,
                     [&updates](const QString &, const AggregatedProgress &progress) { updates << progress; });

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success) << result.error.message.toStdString();
    EXPECT_EQ(result.outputPath, QDir(outputDir_).filePath(QStringLiteral("Fake_Book.m4b")));
    QFile output(result.outputPath);
    ASSERT_TRUE(output.open(QIODevice::ReadOnly));
    EXPECT_EQ(output.readAll(), QByteArray("enhanced"));

    bool sawEnhancing = false;
    for (int i = 1; i < updates.size(); ++i) {
        EXPECT_GE(static_cast<int>(updates[i].phase), static_cast<int>(updates[i - 1].phase));
        if (updates[i].phase == ConversionPhase::Enhancing) {
            sawEnhancing = true;
            EXPECT_EQ(updates[i].percentage, 98);
        }
    }
    EXPECT_TRUE(sawEnhancing);
    EXPECT_EQ(updates.last().phase, ConversionPhase::Complete);
}

TEST_F(CoordinatorServiceTest, FailedEnhancementKeepsUnenhancedOutput) {
    CoordinatorSettings settings = settingsFor(testsupport::FakeEngineOptions());
    settings.enhancement.enabled = true;
    settings.enhancement.program = testsupport::writeFakeEnhancer(tempDir_.path(), 2);
    settings.enhancement.engines = QStringList{QStringLiteral("xtts")};
    CoordinatorService service(settings);

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error.isError());
    EXPECT_EQ(result.outputPath, QDir(outputDir_).filePath(QStringLiteral("Fake_Book.m4b")));
    EXPECT_EQ(QFileInfo(result.outputPath).size(), 0);
}

TEST_F(CoordinatorServiceTest, EnhancementSkippedForOtherEngines) {
    CoordinatorSettings settings = settingsFor(testsupport::FakeEngineOptions());
    settings.enhancement.enabled = true;
    settings.enhancement.program = testsupport::writeFakeEnhancer(tempDir_.path());
    CoordinatorService service(settings);
    bool sawEnhancing = false;
    QObject::connect(&service, &CoordinatorService::progressChanged,
                     [&sawEnhancing](const QString &, const AggregatedProgress &progress) {
                         if (progress.phase == ConversionPhase::Enhancing) {
                             sawEnhancing = true;
                         }
                     });

    ASSERT_TRUE(service.startConversion(QStringLiteral("job1"), configFor(1)));
    ConversionResult result;
    ASSERT_TRUE(runToFinish(service, QStringLiteral("job1"), &result));

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(sawEnhancing);
    EXPECT_EQ(QFileInfo(result.outputPath).size(), 0);
}
