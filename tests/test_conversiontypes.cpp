#include <gtest/gtest.h>

#include "Core/conversiontypes.h"

TEST(ConversionTypesTest, PhaseOnlyMovesForward) {
    ConversionSession session;
    EXPECT_EQ(session.phase, ConversionPhase::Preparing);
    EXPECT_TRUE(session.advancePhase(ConversionPhase::Converting));
    EXPECT_TRUE(session.advancePhase(ConversionPhase::Assembling));
    EXPECT_FALSE(session.advancePhase(ConversionPhase::Converting));
    EXPECT_EQ(session.phase, ConversionPhase::Assembling);
}

TEST(ConversionTypesTest, TerminalPhasesAreFinal) {
    ConversionSession completed;
    completed.advancePhase(ConversionPhase::Complete);
    EXPECT_FALSE(completed.advancePhase(ConversionPhase::Error));
    EXPECT_EQ(completed.phase, ConversionPhase::Complete);

    ConversionSession failed;
    failed.advancePhase(ConversionPhase::Converting);
    EXPECT_TRUE(failed.advancePhase(ConversionPhase::Error));
    EXPECT_FALSE(failed.advancePhase(ConversionPhase::Converting));
    EXPECT_EQ(failed.phase, ConversionPhase::Error);
}

TEST(ConversionTypesTest, PartitionModeNames) {
    bool ok = false;
    EXPECT_EQ(partitionModeFromName(QStringLiteral("Chapters"), &ok), PartitionMode::Chapters);
    EXPECT_TRUE(ok);
    EXPECT_EQ(partitionModeFromName(QString(), &ok), PartitionMode::Sentences);
    EXPECT_TRUE(ok);
    partitionModeFromName(QStringLiteral("pages"), &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(partitionModeName(PartitionMode::Chapters), QStringLiteral("chapters"));
}

TEST(ConversionTypesTest, AssignmentUnitLookup) {
    WorkerAssignment range;
    range.units = UnitRange{10, 14};
    EXPECT_EQ(range.unitCount(), 5);
    EXPECT_EQ(range.unitAt(0), 10);
    EXPECT_EQ(range.unitAt(4), 14);
    EXPECT_EQ(range.unitAt(9), 14);

    WorkerAssignment list;
    list.units = UnitRange{3, 20};
    list.assignedIndices = QVector<int>{3, 8, 20};
    EXPECT_EQ(list.unitCount(), 3);
    EXPECT_EQ(list.unitAt(1), 8);
    EXPECT_EQ(list.unitAt(7), 20);
}

TEST(ConversionTypesTest, ConfigJsonRoundTrip) {
    ConversionConfig config;
    config.workerCount = 3;
    config.documentPath = QStringLiteral("/books/a.epub");
    config.outputDir = QStringLiteral("/out");
    config.partitionMode = PartitionMode::Chapters;
    config.engine.device = QStringLiteral("gpu");
    config.metadata.title = QStringLiteral("A");

    const ConversionConfig restored = ConversionConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.workerCount, 3);
    EXPECT_EQ(restored.documentPath, config.documentPath);
    EXPECT_EQ(restored.partitionMode, PartitionMode::Chapters);
    EXPECT_EQ(restored.engine.device, QStringLiteral("gpu"));
    EXPECT_EQ(restored.metadata.title, QStringLiteral("A"));
}

TEST(ConversionTypesTest, AnalyticsJsonKeys) {
    ConversionAnalytics analytics;
    analytics.totalUnits = 100;
    analytics.unitsPerMinute = 12.5;
    analytics.isResume = true;
    analytics.unitsProcessedInSession = 40;

    QJsonObject obj = analytics.toJson();
    EXPECT_EQ(obj.value(QStringLiteral("totalSentences")).toInt(), 100);
    EXPECT_DOUBLE_EQ(obj.value(QStringLiteral("sentencesPerMinute")).toDouble(), 12.5);
    EXPECT_TRUE(obj.value(QStringLiteral("isResumeJob")).toBool());
    EXPECT_EQ(obj.value(QStringLiteral("sentencesProcessedInSession")).toInt(), 40);
    EXPECT_FALSE(obj.contains(QStringLiteral("wasCancelled")));

    analytics.wasCancelled = true;
    analytics.completedUnitsAtCancel = 55;
    obj = analytics.toJson();
    EXPECT_TRUE(obj.value(QStringLiteral("wasCancelled")).toBool());
    EXPECT_EQ(obj.value(QStringLiteral("completedSentencesAtCancel")).toInt(), 55);
}

TEST(ConversionTypesTest, ResumeCheckJsonRoundTrip) {
    ResumeCheckResult result;
    result.success = true;
    result.canResume = true;
    result.sessionId = QStringLiteral("s1");
    result.totalUnits = 10;
    result.missingIndices = QVector<int>{4, 5};
    result.missingRanges.append(MissingRange{4, 5, 2});

    const ResumeCheckResult restored = ResumeCheckResult::fromJson(result.toJson());
    EXPECT_TRUE(restored.canResume);
    EXPECT_EQ(restored.sessionId, QStringLiteral("s1"));
    EXPECT_EQ(restored.missingIndices, result.missingIndices);
    ASSERT_EQ(restored.missingRanges.size(), 1);
    EXPECT_EQ(restored.missingRanges[0], (MissingRange{4, 5, 2}));
}

TEST(ConversionTypesTest, ErrorJson) {
    const CoordinatorError error = CoordinatorError::make(CoordinatorErrorKind::Stall, QStringLiteral("stuck"),
                                                          QString(), 9);
    EXPECT_TRUE(error.isError());
    const QJsonObject obj = error.toJson();
    EXPECT_EQ(obj.value(QStringLiteral("kind")).toString(), QStringLiteral("stall"));
    EXPECT_EQ(obj.value(QStringLiteral("exitCode")).toInt(), 9);
    EXPECT_FALSE(obj.contains(QStringLiteral("details")));

    EXPECT_FALSE(CoordinatorError().isError());
    EXPECT_EQ(boundedOutputTail(QString(40000, QLatin1Char('x'))).size(), 32 * 1024);
}
