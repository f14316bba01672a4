#include "assemblyoutputparser.h"

#include <QRegularExpression>
#include <QtMath>

AssemblyOutputParser::AssemblyOutputParser(int totalChapters, const QString &outputExtension)
    : m_totalChapters(qMax(0, totalChapters))
    , m_outputExtension(outputExtension.isEmpty() ? QStringLiteral("m4b") : outputExtension)
{
}

bool AssemblyOutputParser::processLine(const QString &line)
{
    const AssemblySubPhase previousPhase = m_subPhase;
    const int previousProgress = m_subProgress;
    const int previousChapter = m_currentChapter;

    static const QRegularExpression chapterRegex(QStringLiteral("\\[ASSEMBLE\\] Chapter (\\d+):"));
    const QRegularExpressionMatch chapterMatch = chapterRegex.match(line);
    if (chapterMatch.hasMatch() && m_subPhase == AssemblySubPhase::Combining) {
        m_currentChapter = chapterMatch.captured(1).toInt();
        m_overrideMessage.clear();
        if (m_totalChapters > 0) {
            setSubProgress(AssemblySubPhase::Combining, qRound(m_currentChapter * 100.0 / m_totalChapters));
        }
    }

    static const QRegularExpression assembleRegex(QStringLiteral("Assemble - ([\\d.]+)%"));
    const QRegularExpressionMatch assembleMatch = assembleRegex.match(line);
    if (assembleMatch.hasMatch() && m_subPhase == AssemblySubPhase::Combining) {
        const double chapterProgress = assembleMatch.captured(1).toDouble();
        double combined = chapterProgress;
        if (m_totalChapters > 0) {
            combined = qMax(0, m_currentChapter - 1) * 100.0 / m_totalChapters + chapterProgress / m_totalChapters;
        }
        m_overrideMessage.clear();
        setSubProgress(AssemblySubPhase::Combining, qMin(100, qRound(combined)));
    }

    if (line.contains(QStringLiteral("Creating VTT")) || line.contains(QStringLiteral("[VTT]"))) {
        if (m_subPhase != AssemblySubPhase::Subtitles) {
            setSubProgress(AssemblySubPhase::Subtitles, 0);
        }
        if (line.contains(QStringLiteral("Building VTT"))) {
            setSubProgress(AssemblySubPhase::Subtitles, 20);
        }
        if (line.contains(QStringLiteral("Getting audio durations"))) {
            setSubProgress(AssemblySubPhase::Subtitles, 40);
        }
        if (line.contains(QStringLiteral("Creating VTT blocks"))) {
            setSubProgress(AssemblySubPhase::Subtitles, 60);
        }
        if (line.contains(QStringLiteral("Writing"))) {
            setSubProgress(AssemblySubPhase::Subtitles, 80);
        }
        if (line.contains(QStringLiteral("VTT file created"))) {
            setSubProgress(AssemblySubPhase::Subtitles, 100);
        }
        m_overrideMessage.clear();
    }

    static const QRegularExpression exportRegex(QStringLiteral("Export - ([\\d.]+)%"));
    const QRegularExpressionMatch exportMatch = exportRegex.match(line);
    if (exportMatch.hasMatch()) {
        m_overrideMessage.clear();
        setSubProgress(AssemblySubPhase::Encoding, qBound(0, qRound(exportMatch.captured(1).toDouble()), 100));
    }

    if (line.contains(QStringLiteral("Combining chapters into final")) && m_subPhase == AssemblySubPhase::Combining) {
        setSubProgress(AssemblySubPhase::Combining, 95);
        m_overrideMessage = QStringLiteral("Combining chapters into final audiobook...");
    }

    const QRegularExpression outputRegex(
        QStringLiteral("(?:output[^']*to|saved to|created|wrote)[:\\s]+(['\"]?)([\\/~][^'\":\\n]+\\.%1)\\1")
            .arg(QRegularExpression::escape(m_outputExtension)),
        QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch outputMatch = outputRegex.match(line);
    if (outputMatch.hasMatch()) {
        m_outputPath = outputMatch.captured(2).trimmed();
    }

    return previousPhase != m_subPhase || previousProgress != m_subProgress || previousChapter != m_currentChapter;
}

AssemblySubPhase AssemblyOutputParser::subPhase() const
{
    return m_subPhase;
}

int AssemblyOutputParser::subProgress() const
{
    return m_subProgress;
}

int AssemblyOutputParser::currentChapter() const
{
    return m_currentChapter;
}

int AssemblyOutputParser::totalChapters() const
{
    return m_totalChapters;
}

QString AssemblyOutputParser::detectedOutputPath() const
{
    return m_outputPath;
}

int AssemblyOutputParser::overallPercent() const
{
    return overallPercent(m_subPhase, m_subProgress);
}

int AssemblyOutputParser::overallPercent(AssemblySubPhase subPhase, int subProgress)
{
    const int progress = qBound(0, subProgress, 100);
    switch (subPhase) {
    case AssemblySubPhase::None:
    case AssemblySubPhase::Combining:
        return qRound(progress * 0.6);
    case AssemblySubPhase::Subtitles:
        return 60 + qRound(progress * 0.1);
    case AssemblySubPhase::Encoding:
        return 70 + qRound(progress * 0.25);
    case AssemblySubPhase::Metadata:
        return 95 + qRound(progress * 0.05);
    }
    return 0;
}

QString AssemblyOutputParser::message() const
{
    if (!m_overrideMessage.isEmpty()) {
        return m_overrideMessage;
    }

    switch (m_subPhase) {
    case AssemblySubPhase::None:
    case AssemblySubPhase::Combining:
        return m_currentChapter > 0
                   ? QStringLiteral("Combining chapter %1/%2 (%3%)").arg(m_currentChapter).arg(m_totalChapters).arg(m_subProgress)
                   : QStringLiteral("Combining chapters... (%1%)").arg(m_subProgress);
    case AssemblySubPhase::Subtitles:
        return QStringLiteral("Creating subtitles... (%1%)").arg(m_subProgress);
    case AssemblySubPhase::Encoding:
        return QStringLiteral("Encoding audiobook... (%1%)").arg(m_subProgress);
    case AssemblySubPhase::Metadata:
        return QStringLiteral("Applying metadata...");
    }
    return QString();
}

AssemblyProgress AssemblyOutputParser::snapshot() const
{
    AssemblyProgress progress;
    progress.subPhase = m_subPhase;
    progress.subProgress = m_subProgress;
    progress.overallPercent = overallPercent();
    progress.chapter = m_currentChapter;
    progress.totalChapters = m_totalChapters;
    progress.message = message();
    return progress;
}

void AssemblyOutputParser::enterMetadataPhase(int subProgress)
{
    m_overrideMessage.clear();
    setSubProgress(AssemblySubPhase::Metadata, subProgress);
}

void AssemblyOutputParser::setSubProgress(AssemblySubPhase subPhase, int progress)
{
    if (static_cast<int>(subPhase) < static_cast<int>(m_subPhase)) {
        return;
    }
    m_subPhase = subPhase;
    m_subProgress = qBound(0, progress, 100);
}
