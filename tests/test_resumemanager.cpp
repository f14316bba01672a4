#include <gtest/gtest.h>

#include <QDateTime>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "Modules/Resume/resumemanager.h"
#include "testsupport.h"

class ResumeManagerTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir_;
    QString sessionsRoot_;
    QString document_;
    CoordinatorSettings settings_;

    void SetUp() override
    {
        sessionsRoot_ = QDir(tempDir_.path()).filePath(QStringLiteral("tmp"));
        document_ = QDir(tempDir_.path()).filePath(QStringLiteral("book.epub"));
        testsupport::writeTextFile(document_, QByteArray("epub"));
        settings_.engine.sessionsRoot = sessionsRoot_;
    }

    QString otherDocument()
    {
        const QString path = QDir(tempDir_.path()).filePath(QStringLiteral("other.epub"));
        testsupport::writeTextFile(path, QByteArray("epub"));
        return path;
    }
};

TEST_F(ResumeManagerTest, InspectsPartialSession) {
    const QString sessionDir = testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 10,
                                                          QVector<int>{0, 1, 2, 5, 9});
    const ResumeManager manager(settings_);
    const ResumeCheckResult result = manager.inspectSession(sessionDir);

    ASSERT_TRUE(result.success) << result.error.toStdString();
    EXPECT_EQ(result.sessionId, QStringLiteral("s1"));
    EXPECT_EQ(result.totalUnits, 10);
    EXPECT_EQ(result.completedUnits, 5);
    EXPECT_EQ(result.missingUnits, 5);
    EXPECT_EQ(result.missingIndices, (QVector<int>{3, 4, 6, 7, 8}));
    ASSERT_EQ(result.missingRanges.size(), 2);
    EXPECT_EQ(result.missingRanges[0], (MissingRange{3, 4, 2}));
    EXPECT_EQ(result.missingRanges[1], (MissingRange{6, 8, 3}));
    EXPECT_EQ(result.progressPercent, 50);
    EXPECT_TRUE(result.canResume);
    EXPECT_FALSE(result.complete);
    EXPECT_EQ(result.sourceDocumentPath, document_);
}

TEST_F(ResumeManagerTest, IgnoresUnrelatedFiles) {
    const QString sessionDir = testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 4,
                                                          QVector<int>{1});
    const QString sentencesDir = testsupport::sentencesDirFor(sessionsRoot_, QStringLiteral("s1"));
    testsupport::writeTextFile(QDir(sentencesDir).filePath(QStringLiteral("abc.flac")), QByteArray());
    testsupport::writeTextFile(QDir(sentencesDir).filePath(QStringLiteral("2.wav")), QByteArray());
    testsupport::writeTextFile(QDir(sentencesDir).filePath(QStringLiteral("12.flac")), QByteArray());

    const ResumeCheckResult result = ResumeManager(settings_).inspectSession(sessionDir);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.completedUnits, 1);
    EXPECT_EQ(result.missingIndices, (QVector<int>{0, 2, 3}));
}

TEST_F(ResumeManagerTest, CompleteSession) {
    const QString sessionDir = testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 3,
                                                          QVector<int>{0, 1, 2});
    const ResumeCheckResult result = ResumeManager(settings_).inspectSession(sessionDir);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.complete);
    EXPECT_FALSE(result.canResume);
    EXPECT_TRUE(result.missingIndices.isEmpty());
    EXPECT_EQ(result.progressPercent, 100);
}

TEST_F(ResumeManagerTest, SessionWithoutProgressCannotResume) {
    const QString sessionDir = testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 3,
                                                          QVector<int>());
    const ResumeCheckResult result = ResumeManager(settings_).inspectSession(sessionDir);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.canResume);
    EXPECT_FALSE(result.complete);
    EXPECT_EQ(result.missingUnits, 3);
}

TEST_F(ResumeManagerTest, MissingSentencesDirectoryMeansAllMissing) {
    const QString sessionDir = testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 3,
                                                          QVector<int>{0});
    ASSERT_TRUE(QDir(testsupport::sentencesDirFor(sessionsRoot_, QStringLiteral("s1"))).removeRecursively());

    const ResumeCheckResult result = ResumeManager(settings_).inspectSession(sessionDir);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.completedUnits, 0);
    EXPECT_EQ(result.missingIndices, (QVector<int>{0, 1, 2}));
}

TEST_F(ResumeManagerTest, FindsSessionByDocument) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("mine"), document_, 4, QVector<int>{0});
    testsupport::createSession(sessionsRoot_, QStringLiteral("theirs"), otherDocument(), 4, QVector<int>{0, 1});

    const ResumeCheckResult result = ResumeManager(settings_).checkResumeStatus(document_);
    ASSERT_TRUE(result.success) << result.error.toStdString();
    EXPECT_EQ(result.sessionId, QStringLiteral("mine"));
    EXPECT_EQ(result.completedUnits, 1);
}

TEST_F(ResumeManagerTest, NoSessionForDocument) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("theirs"), otherDocument(), 4, QVector<int>{0});
    const ResumeCheckResult result = ResumeManager(settings_).checkResumeStatus(document_);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.isEmpty());
}

TEST_F(ResumeManagerTest, ExplicitSessionId) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 4, QVector<int>{0, 3});
    const ResumeManager manager(settings_);

    const ResumeCheckResult found = manager.checkResumeStatus(document_, QStringLiteral("s1"));
    ASSERT_TRUE(found.success);
    EXPECT_EQ(found.missingIndices, (QVector<int>{1, 2}));

    EXPECT_FALSE(manager.checkResumeStatus(document_, QStringLiteral("nope")).success);
    EXPECT_FALSE(manager.checkResumeStatus(otherDocument(), QStringLiteral("s1")).success);
}

TEST_F(ResumeManagerTest, UsesNewestProcessDirectory) {
    const QString sessionDir = testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 10,
                                                          QVector<int>{0, 1});
    ASSERT_TRUE(testsupport::setModificationTime(QDir(sessionDir).filePath(QStringLiteral("proc/session-state.json")),
                                                 QDateTime::currentDateTime().addSecs(-3600)));

    const QString retryDir = QDir(sessionDir).filePath(QStringLiteral("attempt-2"));
    const QString retrySentences = QDir(retryDir).filePath(QStringLiteral("chapters/sentences"));
    QJsonObject state;
    state.insert(QStringLiteral("session_id"), QStringLiteral("s1"));
    state.insert(QStringLiteral("total_sentences"), 6);
    state.insert(QStringLiteral("epub_path"), document_);
    state.insert(QStringLiteral("chapters_dir_sentences"), retrySentences);
    testsupport::writeTextFile(QDir(retryDir).filePath(QStringLiteral("session-state.json")),
                               QJsonDocument(state).toJson());
    for (int index : {0, 1, 2, 3}) {
        testsupport::writeTextFile(QDir(retrySentences).filePath(QStringLiteral("%1.flac").arg(index)), QByteArray());
    }

    const ResumeCheckResult result = ResumeManager(settings_).checkResumeStatus(document_);
    ASSERT_TRUE(result.success) << result.error.toStdString();
    EXPECT_EQ(result.processDir, QDir::cleanPath(retryDir));
    EXPECT_EQ(result.totalUnits, 6);
    EXPECT_EQ(result.completedUnits, 4);
    EXPECT_EQ(result.missingIndices, (QVector<int>{4, 5}));
}

TEST_F(ResumeManagerTest, MatchesEitherRecordedDocumentPath) {
    const QString engineCopy = QDir(tempDir_.path()).filePath(QStringLiteral("engine/book-copy.epub"));
    testsupport::writeTextFile(engineCopy, QByteArray("epub"));
    testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), engineCopy, 4, QVector<int>{0},
                               QJsonObject{{QStringLiteral("source_epub_path"), document_}});
    const ResumeManager manager(settings_);

    const ResumeCheckResult byOriginal = manager.checkResumeStatus(document_);
    ASSERT_TRUE(byOriginal.success) << byOriginal.error.toStdString();
    EXPECT_EQ(byOriginal.sessionId, QStringLiteral("s1"));
    EXPECT_EQ(byOriginal.sourceDocumentPath, document_);
    EXPECT_EQ(byOriginal.engineDocumentPath, engineCopy);

    const ResumeCheckResult byEngineCopy = manager.checkResumeStatus(engineCopy);
    ASSERT_TRUE(byEngineCopy.success) << byEngineCopy.error.toStdString();
    EXPECT_EQ(byEngineCopy.sessionId, QStringLiteral("s1"));

    EXPECT_TRUE(manager.checkResumeStatus(engineCopy, QStringLiteral("s1")).success);
    EXPECT_FALSE(manager.checkResumeStatus(otherDocument(), QStringLiteral("s1")).success);
    EXPECT_TRUE(ResumeManager::matchesDocument(QStringList{document_, engineCopy}, engineCopy));
    EXPECT_FALSE(ResumeManager::matchesDocument(QStringList(), document_));
}

TEST_F(ResumeManagerTest, ListsResumableSessions) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("partial"), document_, 4, QVector<int>{0});
    testsupport::createSession(sessionsRoot_, QStringLiteral("done"), document_, 2, QVector<int>{0, 1});
    testsupport::createSession(sessionsRoot_, QStringLiteral("fresh"), document_, 2, QVector<int>());
    testsupport::writeTextFile(QDir(sessionsRoot_).filePath(QStringLiteral("ebook-broken/proc/session-state.json")),
                               QByteArray("{not json"));

    const QVector<ResumeCheckResult> sessions = ResumeManager(settings_).listResumableSessions();
    ASSERT_EQ(sessions.size(), 1);
    EXPECT_EQ(sessions[0].sessionId, QStringLiteral("partial"));
}

TEST_F(ResumeManagerTest, RefreshesIncompleteEvidence) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 4, QVector<int>{0, 1});
    const ResumeManager manager(settings_);

    ResumeCheckResult evidence;
    evidence.success = true;
    evidence.sessionId = QStringLiteral("s1");
    QString error;
    ASSERT_TRUE(manager.ensureEvidenceComplete(document_, &evidence, &error)) << error.toStdString();
    EXPECT_EQ(evidence.totalUnits, 4);
    EXPECT_EQ(evidence.missingIndices, (QVector<int>{2, 3}));
    EXPECT_FALSE(evidence.processDir.isEmpty());
}

TEST_F(ResumeManagerTest, RefreshFailsWithoutSession) {
    ResumeCheckResult evidence;
    QString error;
    EXPECT_FALSE(ResumeManager(settings_).ensureEvidenceComplete(document_, &evidence, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(ResumeManagerTest, BuildsResumeSession) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 10, QVector<int>{0, 1, 3, 4, 8});
    const ResumeManager manager(settings_);
    const ResumeCheckResult evidence = manager.checkResumeStatus(document_);
    ASSERT_TRUE(evidence.success);

    ConversionConfig config;
    config.workerCount = 2;
    config.documentPath = document_;

    ConversionSession session;
    QString error;
    ASSERT_TRUE(manager.buildResumeSession(QStringLiteral("job"), config, evidence, &session, &error));
    EXPECT_TRUE(session.isResume);
    EXPECT_EQ(session.jobId, QStringLiteral("job"));
    EXPECT_EQ(session.baselineCompleted, 5);
    EXPECT_EQ(session.totalMissing, 5);
    EXPECT_EQ(session.prepInfo.sessionId, QStringLiteral("s1"));
    EXPECT_EQ(session.prepInfo.totalUnits, 10);
    EXPECT_GT(session.startTimeMs, 0);

    ASSERT_EQ(session.workers.size(), 2);
    EXPECT_EQ(session.workers[0].assignment.assignedIndices, (QVector<int>{2, 5, 6}));
    EXPECT_EQ(session.workers[1].assignment.assignedIndices, (QVector<int>{7, 9}));
    EXPECT_EQ(session.workers[1].currentUnit, 7);
}

TEST_F(ResumeManagerTest, CompleteEvidenceBuildsSessionWithoutWorkers) {
    testsupport::createSession(sessionsRoot_, QStringLiteral("s1"), document_, 2, QVector<int>{0, 1});
    const ResumeManager manager(settings_);
    const ResumeCheckResult evidence = manager.checkResumeStatus(document_);

    ConversionSession session;
    ASSERT_TRUE(manager.buildResumeSession(QStringLiteral("job"), ConversionConfig(), evidence, &session));
    EXPECT_TRUE(session.workers.isEmpty());
    EXPECT_EQ(session.baselineCompleted, 2);
}

TEST_F(ResumeManagerTest, SameDocumentComparison) {
    const QString relative = QDir(tempDir_.path()).filePath(QStringLiteral("sub/../book.epub"));
    EXPECT_TRUE(ResumeManager::isSameDocument(document_, relative));
    EXPECT_TRUE(ResumeManager::isSameDocument(document_, document_));
    EXPECT_FALSE(ResumeManager::isSameDocument(document_, otherDocument()));
    EXPECT_FALSE(ResumeManager::isSameDocument(document_, QString()));
}

TEST_F(ResumeManagerTest, ComputesMissing) {
    EXPECT_EQ(ResumeManager::computeMissing(5, QSet<int>{0, 2, 4}), (QVector<int>{1, 3}));
    EXPECT_TRUE(ResumeManager::computeMissing(0, QSet<int>()).isEmpty());
}
