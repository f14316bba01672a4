#include "outputrelocator.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>

namespace {

QStringList significantWords(const QString &name)
{
    static const QRegularExpression separatorRegex(QStringLiteral("[_\\-.]"));
    QString normalized = name.toLower();
    normalized.replace(separatorRegex, QStringLiteral(" "));

    QStringList words;
    const QStringList parts = normalized.split(' ', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        if (part.size() > 2) {
            words << part;
        }
    }
    return words;
}

QString baseNameWithoutExtension(const QString &path, const QString &extension)
{
    const QString fileName = QFileInfo(path).fileName();
    const QString suffix = QStringLiteral(".") + extension;
    if (fileName.endsWith(suffix, Qt::CaseInsensitive)) {
        return fileName.left(fileName.size() - suffix.size());
    }
    return QFileInfo(path).completeBaseName();
}

} // namespace

QString OutputRelocator::findLatestOutput(const QString &outputDir, const QString &extension)
{
    const QDir dir(outputDir);
    if (outputDir.isEmpty() || !dir.exists()) {
        return QString();
    }

    const QFileInfoList files = dir.entryInfoList(QStringList() << QStringLiteral("*.%1").arg(extension),
                                                  QDir::Files, QDir::Time);
    for (const QFileInfo &file : files) {
        if (!file.fileName().startsWith(QStringLiteral("._"))) {
            return file.absoluteFilePath();
        }
    }
    return QString();
}

QString OutputRelocator::ensureExtension(const QString &fileName, const QString &extension)
{
    const QString suffix = QStringLiteral(".") + extension;
    if (fileName.endsWith(suffix, Qt::CaseInsensitive)) {
        return fileName;
    }
    return fileName + suffix;
}

QString OutputRelocator::uniqueFilePath(const QString &filePath)
{
    if (!QFileInfo::exists(filePath)) {
        return filePath;
    }

    const QFileInfo info(filePath);
    const QString dirPath = info.absolutePath();
    const QString suffix = info.suffix().isEmpty() ? QString() : QStringLiteral(".") + info.suffix();
    const QString baseName = info.fileName().left(info.fileName().size() - suffix.size());

    for (int counter = 2;; ++counter) {
        const QString candidate = QDir(dirPath).filePath(QStringLiteral("%1 %2%3").arg(baseName).arg(counter).arg(suffix));
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}

bool OutputRelocator::moveFile(const QString &fromPath, const QString &toPath, QString *errorMessage)
{
    if (!QDir().mkpath(QFileInfo(toPath).absolutePath())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("无法创建目录：%1").arg(QFileInfo(toPath).absolutePath());
        }
        return false;
    }

    if (QFile::rename(fromPath, toPath)) {
        return true;
    }

    if (!QFile::copy(fromPath, toPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("复制文件失败：%1 -> %2").arg(fromPath, toPath);
        }
        return false;
    }

    if (!QFile::remove(fromPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("已复制但无法删除源文件：%1").arg(fromPath);
        }
        return false;
    }
    return true;
}

QString OutputRelocator::findMatchingSubtitle(const QString &outputPath, const QString &extension)
{
    const QFileInfo outputInfo(outputPath);
    const QString originalBase = baseNameWithoutExtension(outputPath, extension);
    const QStringList originalWords = significantWords(originalBase);
    QString underscored = originalBase;
    underscored.replace(' ', '_');

    const QFileInfoList subtitles = QDir(outputInfo.absolutePath())
                                        .entryInfoList(QStringList() << QStringLiteral("*.vtt") << QStringLiteral("*.VTT"),
                                                       QDir::Files, QDir::Name);
    for (const QFileInfo &subtitle : subtitles) {
        const QString subtitleBase = subtitle.completeBaseName();
        const QStringList subtitleWords = significantWords(subtitleBase);

        int matching = 0;
        for (const QString &word : originalWords) {
            if (subtitleWords.contains(word)) {
                ++matching;
            }
        }
        const double ratio = static_cast<double>(matching) / qMax(originalWords.size(), 1);

        if (ratio >= 0.5 || subtitleBase.contains(underscored)) {
            return subtitle.absoluteFilePath();
        }
    }
    return QString();
}

bool OutputRelocator::moveSubtitle(const QString &originalOutputPath,
                                   const QString &newOutputPath,
                                   QString *movedTo,
                                   QString *errorMessage,
                                   const QString &extension)
{
    if (movedTo) {
        movedTo->clear();
    }

    const QString subtitlePath = findMatchingSubtitle(originalOutputPath, extension);
    if (subtitlePath.isEmpty()) {
        return true;
    }

    const QString newBase = baseNameWithoutExtension(newOutputPath, extension);
    const QString subtitleDir = QDir(QFileInfo(newOutputPath).absolutePath()).filePath(QStringLiteral("vtt"));
    const QString targetPath = QDir(subtitleDir).filePath(newBase + QStringLiteral(".vtt"));

    if (QFileInfo::exists(targetPath) && !QFile::remove(targetPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("无法覆盖已有字幕：%1").arg(targetPath);
        }
        return false;
    }

    if (!moveFile(subtitlePath, targetPath, errorMessage)) {
        return false;
    }

    if (movedTo) {
        *movedTo = targetPath;
    }
    return true;
}

bool OutputRelocator::relocate(const QString &inputPath,
                               const QString &outputDir,
                               const QString &outputFilename,
                               QString *newPath,
                               QString *errorMessage,
                               const QString &extension)
{
    if (newPath) {
        *newPath = inputPath;
    }

    if (outputFilename.trimmed().isEmpty() || outputDir.isEmpty()) {
        return true;
    }

    QString targetPath = QDir(outputDir).filePath(ensureExtension(outputFilename.trimmed(), extension));
    if (QFileInfo(targetPath).absoluteFilePath() == QFileInfo(inputPath).absoluteFilePath()) {
        return true;
    }
    targetPath = uniqueFilePath(targetPath);

    if (!moveFile(inputPath, targetPath, errorMessage)) {
        return false;
    }
    if (newPath) {
        *newPath = targetPath;
    }

    // 字幕移动失败不影响成品
    QString subtitleError;
    if (!moveSubtitle(inputPath, targetPath, nullptr, &subtitleError, extension) && errorMessage) {
        *errorMessage = subtitleError;
    }
    return true;
}
