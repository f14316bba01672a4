#include "progresslineparser.h"

#include <QRegularExpression>

bool Ebook2AudiobookProgressParser::parseProgressLine(const QString &line, UnitProgress *progress) const
{
    static const QRegularExpression progressRegex(
        QStringLiteral("(?:Converting\\s+)?([\\d.]+)%:?\\s*:?\\s*(\\d+)\\/(\\d+)(?:\\s|$)"),
        QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch match = progressRegex.match(line);
    if (!match.hasMatch()) {
        return false;
    }

    bool percentOk = false;
    bool currentOk = false;
    bool totalOk = false;
    const double percent = match.captured(1).toDouble(&percentOk);
    const int current = match.captured(2).toInt(&currentOk);
    const int total = match.captured(3).toInt(&totalOk);
    if (!percentOk || !currentOk || !totalOk) {
        return false;
    }

    if (progress) {
        progress->percent = percent;
        progress->current = current;
        progress->total = total;
    }
    return true;
}

bool Ebook2AudiobookProgressParser::isRecoveryMarker(const QString &line) const
{
    return line.contains(QStringLiteral("Recovering missing sentence"));
}
