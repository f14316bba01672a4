#include <gtest/gtest.h>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "Modules/Assembly/outputrelocator.h"
#include "testsupport.h"

class OutputRelocatorTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir_;

    QString path(const QString &name) const { return QDir(tempDir_.path()).filePath(name); }

    QString touch(const QString &name, const QDateTime &modified = QDateTime()) const
    {
        const QString filePath = path(name);
        testsupport::writeTextFile(filePath, QByteArray("data"));
        if (modified.isValid()) {
            QFile file(filePath);
            if (file.open(QIODevice::ReadWrite)) {
                file.setFileTime(modified, QFileDevice::FileModificationTime);
            }
        }
        return filePath;
    }
};

TEST_F(OutputRelocatorTest, EnsureExtension) {
    EXPECT_EQ(OutputRelocator::ensureExtension(QStringLiteral("Book")), QStringLiteral("Book.m4b"));
    EXPECT_EQ(OutputRelocator::ensureExtension(QStringLiteral("Book.M4B")), QStringLiteral("Book.M4B"));
}

TEST_F(OutputRelocatorTest, UniqueFilePath) {
    const QString target = path(QStringLiteral("Book.m4b"));
    EXPECT_EQ(OutputRelocator::uniqueFilePath(target), target);

    touch(QStringLiteral("Book.m4b"));
    EXPECT_EQ(OutputRelocator::uniqueFilePath(target), path(QStringLiteral("Book 2.m4b")));

    touch(QStringLiteral("Book 2.m4b"));
    EXPECT_EQ(OutputRelocator::uniqueFilePath(target), path(QStringLiteral("Book 3.m4b")));
}

TEST_F(OutputRelocatorTest, FindsLatestOutput) {
    const QDateTime now = QDateTime::currentDateTime();
    touch(QStringLiteral("old.m4b"), now.addSecs(-600));
    const QString fresh = touch(QStringLiteral("fresh.m4b"), now.addSecs(-60));
    touch(QStringLiteral("._fresh.m4b"), now);
    touch(QStringLiteral("notes.txt"), now);

    EXPECT_EQ(OutputRelocator::findLatestOutput(tempDir_.path()), fresh);
    EXPECT_TRUE(OutputRelocator::findLatestOutput(path(QStringLiteral("nope"))).isEmpty());
}

TEST_F(OutputRelocatorTest, MatchesSubtitleWithUnderscores) {
    const QString subtitle = touch(QStringLiteral("The_Left_Hand_of_Darkness.vtt"));
    touch(QStringLiteral("Other_Book.vtt"));
    EXPECT_EQ(OutputRelocator::findMatchingSubtitle(path(QStringLiteral("The Left Hand of Darkness.m4b"))), subtitle);
}

TEST_F(OutputRelocatorTest, NoMatchingSubtitle) {
    touch(QStringLiteral("Unrelated.vtt"));
    EXPECT_TRUE(OutputRelocator::findMatchingSubtitle(path(QStringLiteral("Book Title.m4b"))).isEmpty());
}

TEST_F(OutputRelocatorTest, RelocatesOutputAndSubtitle) {
    const QString original = touch(QStringLiteral("Fake_Book.m4b"));
    touch(QStringLiteral("Fake_Book.vtt"));

    QString newPath;
    QString error;
    ASSERT_TRUE(OutputRelocator::relocate(original, tempDir_.path(), QStringLiteral("My Book"), &newPath, &error));
    EXPECT_EQ(newPath, path(QStringLiteral("My Book.m4b")));
    EXPECT_TRUE(QFileInfo::exists(newPath));
    EXPECT_FALSE(QFileInfo::exists(original));
    EXPECT_TRUE(QFileInfo::exists(path(QStringLiteral("vtt/My Book.vtt"))));
    EXPECT_FALSE(QFileInfo::exists(path(QStringLiteral("Fake_Book.vtt"))));
}

TEST_F(OutputRelocatorTest, RelocateAvoidsOverwriting) {
    const QString original = touch(QStringLiteral("Fake_Book.m4b"));
    touch(QStringLiteral("My Book.m4b"));

    QString newPath;
    ASSERT_TRUE(OutputRelocator::relocate(original, tempDir_.path(), QStringLiteral("My Book.m4b"), &newPath));
    EXPECT_EQ(newPath, path(QStringLiteral("My Book 2.m4b")));
}

TEST_F(OutputRelocatorTest, RelocateWithoutNameKeepsPath) {
    const QString original = touch(QStringLiteral("Fake_Book.m4b"));
    QString newPath;
    ASSERT_TRUE(OutputRelocator::relocate(original, tempDir_.path(), QString(), &newPath));
    EXPECT_EQ(newPath, original);
    EXPECT_TRUE(QFileInfo::exists(original));
}

TEST_F(OutputRelocatorTest, MoveFileFailsForMissingSource) {
    QString error;
    EXPECT_FALSE(OutputRelocator::moveFile(path(QStringLiteral("missing.m4b")), path(QStringLiteral("dest.m4b")), &error));
    EXPECT_FALSE(error.isEmpty());
}
