#include "conversiontypes.h"

namespace {

QJsonArray intArrayToJson(const QVector<int> &values)
{
    QJsonArray array;
    for (int value : values) {
        array.append(value);
    }
    return array;
}

QVector<int> intArrayFromJson(const QJsonArray &array)
{
    QVector<int> values;
    values.reserve(array.size());
    for (const QJsonValue &value : array) {
        values.append(value.toInt());
    }
    return values;
}

QJsonArray chaptersToJson(const QVector<ChapterBoundary> &chapters)
{
    QJsonArray array;
    for (const ChapterBoundary &chapter : chapters) {
        array.append(chapter.toJson());
    }
    return array;
}

QVector<ChapterBoundary> chaptersFromJson(const QJsonArray &array)
{
    QVector<ChapterBoundary> chapters;
    chapters.reserve(array.size());
    for (const QJsonValue &value : array) {
        chapters.append(ChapterBoundary::fromJson(value.toObject()));
    }
    return chapters;
}

} // namespace

QString partitionModeName(PartitionMode mode)
{
    return mode == PartitionMode::Chapters ? QStringLiteral("chapters") : QStringLiteral("sentences");
}

PartitionMode partitionModeFromName(const QString &name, bool *ok)
{
    const QString normalized = name.trimmed().toLower();
    if (ok) {
        *ok = normalized == QLatin1String("chapters") || normalized == QLatin1String("sentences")
              || normalized.isEmpty();
    }
    return normalized == QLatin1String("chapters") ? PartitionMode::Chapters : PartitionMode::Sentences;
}

QString workerStatusName(WorkerStatus status)
{
    switch (status) {
    case WorkerStatus::Pending:
        return QStringLiteral("pending");
    case WorkerStatus::Running:
        return QStringLiteral("running");
    case WorkerStatus::Complete:
        return QStringLiteral("complete");
    case WorkerStatus::Error:
        return QStringLiteral("error");
    }
    return QString();
}

QString workerFailureReasonName(WorkerFailureReason reason)
{
    switch (reason) {
    case WorkerFailureReason::None:
        return QString();
    case WorkerFailureReason::ExitCode:
        return QStringLiteral("exit_code");
    case WorkerFailureReason::SpawnFailure:
        return QStringLiteral("spawn_failure");
    case WorkerFailureReason::Stalled:
        return QStringLiteral("stalled");
    case WorkerFailureReason::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QString();
}

QString conversionPhaseName(ConversionPhase phase)
{
    switch (phase) {
    case ConversionPhase::Preparing:
        return QStringLiteral("preparing");
    case ConversionPhase::Converting:
        return QStringLiteral("converting");
    case ConversionPhase::Assembling:
        return QStringLiteral("assembling");
    case ConversionPhase::Enhancing:
        return QStringLiteral("enhancing");
    case ConversionPhase::Complete:
        return QStringLiteral("complete");
    case ConversionPhase::Error:
        return QStringLiteral("error");
    }
    return QString();
}

QString assemblySubPhaseName(AssemblySubPhase subPhase)
{
    switch (subPhase) {
    case AssemblySubPhase::None:
        return QString();
    case AssemblySubPhase::Combining:
        return QStringLiteral("combining");
    case AssemblySubPhase::Subtitles:
        return QStringLiteral("vtt");
    case AssemblySubPhase::Encoding:
        return QStringLiteral("encoding");
    case AssemblySubPhase::Metadata:
        return QStringLiteral("metadata");
    }
    return QString();
}

QJsonObject ChapterBoundary::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("chapter_num"), chapterNum);
    obj.insert(QStringLiteral("sentence_start"), unitStart);
    obj.insert(QStringLiteral("sentence_end"), unitEnd);
    obj.insert(QStringLiteral("sentence_count"), unitCount);
    return obj;
}

ChapterBoundary ChapterBoundary::fromJson(const QJsonObject &obj)
{
    ChapterBoundary chapter;
    chapter.chapterNum = obj.value(QStringLiteral("chapter_num")).toInt();
    chapter.unitStart = obj.value(QStringLiteral("sentence_start")).toInt();
    chapter.unitEnd = obj.value(QStringLiteral("sentence_end")).toInt(-1);
    chapter.unitCount = obj.value(QStringLiteral("sentence_count")).toInt(
        chapter.unitEnd >= chapter.unitStart ? chapter.unitEnd - chapter.unitStart + 1 : 0);
    return chapter;
}

QJsonObject DocumentMetadata::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("title"), title);
    obj.insert(QStringLiteral("creator"), creator);
    obj.insert(QStringLiteral("language"), language);
    return obj;
}

DocumentMetadata DocumentMetadata::fromJson(const QJsonObject &obj)
{
    DocumentMetadata metadata;
    metadata.title = obj.value(QStringLiteral("title")).toString();
    metadata.creator = obj.value(QStringLiteral("creator")).toString();
    metadata.language = obj.value(QStringLiteral("language")).toString();
    return metadata;
}

QStringList PrepInfo::documentPaths() const
{
    QStringList paths;
    for (const QString &path : {sourceDocumentPath, engineDocumentPath}) {
        if (!path.isEmpty() && !paths.contains(path)) {
            paths << path;
        }
    }
    return paths;
}

QJsonObject PrepInfo::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("sessionId"), sessionId);
    obj.insert(QStringLiteral("sessionDir"), sessionDir);
    obj.insert(QStringLiteral("processDir"), processDir);
    obj.insert(QStringLiteral("chaptersDir"), chaptersDir);
    obj.insert(QStringLiteral("sentencesDir"), sentencesDir);
    obj.insert(QStringLiteral("sourceDocumentPath"), sourceDocumentPath);
    obj.insert(QStringLiteral("engineDocumentPath"), engineDocumentPath);
    obj.insert(QStringLiteral("totalUnits"), totalUnits);
    obj.insert(QStringLiteral("totalChapters"), totalChapters);
    obj.insert(QStringLiteral("chapters"), chaptersToJson(chapters));
    obj.insert(QStringLiteral("metadata"), metadata.toJson());
    return obj;
}

int WorkerAssignment::unitCount() const
{
    return hasIndexList() ? assignedIndices.size() : units.size();
}

int WorkerAssignment::unitAt(int offset) const
{
    if (hasIndexList()) {
        if (assignedIndices.isEmpty()) {
            return units.start;
        }
        return assignedIndices.at(qBound(0, offset, assignedIndices.size() - 1));
    }
    return qMin(units.start + qMax(0, offset), units.end);
}

QJsonObject WorkerAssignment::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("start"), units.start);
    obj.insert(QStringLiteral("end"), units.end);
    if (isChapterMode()) {
        obj.insert(QStringLiteral("chapterStart"), chapterStart);
        obj.insert(QStringLiteral("chapterEnd"), chapterEnd);
    }
    if (hasIndexList()) {
        obj.insert(QStringLiteral("assignedIndices"), intArrayToJson(assignedIndices));
    }
    return obj;
}

QJsonObject WorkerState::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), id);
    obj.insert(QStringLiteral("assignment"), assignment.toJson());
    obj.insert(QStringLiteral("currentUnit"), currentUnit);
    obj.insert(QStringLiteral("completedUnits"), completedUnits);
    obj.insert(QStringLiteral("totalUnits"), assignment.unitCount());
    obj.insert(QStringLiteral("status"), workerStatusName(status));
    obj.insert(QStringLiteral("retryCount"), retryCount);
    obj.insert(QStringLiteral("pid"), static_cast<double>(pid));
    obj.insert(QStringLiteral("exitCode"), exitCode);
    if (!errorMessage.isEmpty()) {
        obj.insert(QStringLiteral("error"), errorMessage);
    }
    if (failureReason != WorkerFailureReason::None) {
        obj.insert(QStringLiteral("failureReason"), workerFailureReasonName(failureReason));
    }
    obj.insert(QStringLiteral("actualConversions"), actualConversions);
    obj.insert(QStringLiteral("permanentlyFailed"), permanentlyFailed);
    return obj;
}

QJsonObject EngineSettings::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("device"), device);
    obj.insert(QStringLiteral("language"), language);
    obj.insert(QStringLiteral("ttsEngine"), ttsEngine);
    if (!fineTuned.isEmpty()) {
        obj.insert(QStringLiteral("fineTuned"), fineTuned);
    }
    obj.insert(QStringLiteral("enableTextSplitting"), enableTextSplitting);
    return obj;
}

EngineSettings EngineSettings::fromJson(const QJsonObject &obj)
{
    EngineSettings settings;
    settings.device = obj.value(QStringLiteral("device")).toString(settings.device);
    settings.language = obj.value(QStringLiteral("language")).toString(settings.language);
    settings.ttsEngine = obj.value(QStringLiteral("ttsEngine")).toString(settings.ttsEngine);
    settings.fineTuned = obj.value(QStringLiteral("fineTuned")).toString();
    settings.enableTextSplitting = obj.value(QStringLiteral("enableTextSplitting")).toBool(false);
    return settings;
}

bool OutputMetadata::isEmpty() const
{
    return title.isEmpty() && author.isEmpty() && year.isEmpty()
           && coverPath.isEmpty() && outputFilename.isEmpty();
}

QJsonObject OutputMetadata::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("title"), title);
    obj.insert(QStringLiteral("author"), author);
    obj.insert(QStringLiteral("year"), year);
    obj.insert(QStringLiteral("coverPath"), coverPath);
    obj.insert(QStringLiteral("outputFilename"), outputFilename);
    return obj;
}

OutputMetadata OutputMetadata::fromJson(const QJsonObject &obj)
{
    OutputMetadata metadata;
    metadata.title = obj.value(QStringLiteral("title")).toString();
    metadata.author = obj.value(QStringLiteral("author")).toString();
    metadata.year = obj.value(QStringLiteral("year")).toString();
    metadata.coverPath = obj.value(QStringLiteral("coverPath")).toString();
    metadata.outputFilename = obj.value(QStringLiteral("outputFilename")).toString();
    return metadata;
}

QJsonObject ConversionConfig::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("workerCount"), workerCount);
    obj.insert(QStringLiteral("documentPath"), documentPath);
    obj.insert(QStringLiteral("outputDir"), outputDir);
    obj.insert(QStringLiteral("partitionMode"), partitionModeName(partitionMode));
    obj.insert(QStringLiteral("engine"), engine.toJson());
    if (!metadata.isEmpty()) {
        obj.insert(QStringLiteral("metadata"), metadata.toJson());
    }
    return obj;
}

ConversionConfig ConversionConfig::fromJson(const QJsonObject &obj)
{
    ConversionConfig config;
    config.workerCount = qMax(1, obj.value(QStringLiteral("workerCount")).toInt(1));
    config.documentPath = obj.value(QStringLiteral("documentPath")).toString();
    config.outputDir = obj.value(QStringLiteral("outputDir")).toString();
    config.partitionMode = partitionModeFromName(obj.value(QStringLiteral("partitionMode")).toString());
    config.engine = EngineSettings::fromJson(obj.value(QStringLiteral("engine")).toObject());
    config.metadata = OutputMetadata::fromJson(obj.value(QStringLiteral("metadata")).toObject());
    return config;
}

QJsonObject AggregatedProgress::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("phase"), conversionPhaseName(phase));
    obj.insert(QStringLiteral("totalUnits"), totalUnits);
    obj.insert(QStringLiteral("completedUnits"), completedUnits);
    obj.insert(QStringLiteral("completedInSession"), completedInSession);
    obj.insert(QStringLiteral("percentage"), percentage);
    obj.insert(QStringLiteral("activeWorkers"), activeWorkers);

    QJsonArray workerArray;
    for (const WorkerState &worker : workers) {
        workerArray.append(worker.toJson());
    }
    obj.insert(QStringLiteral("workers"), workerArray);

    if (hasEstimate()) {
        obj.insert(QStringLiteral("estimatedRemaining"), estimatedRemainingSeconds);
    }
    obj.insert(QStringLiteral("message"), message);
    if (!error.isEmpty()) {
        obj.insert(QStringLiteral("error"), error);
    }
    if (assemblySubPhase != AssemblySubPhase::None) {
        obj.insert(QStringLiteral("assemblySubPhase"), assemblySubPhaseName(assemblySubPhase));
        obj.insert(QStringLiteral("assemblyProgress"), assemblyProgress);
        obj.insert(QStringLiteral("assemblyChapter"), assemblyChapter);
        obj.insert(QStringLiteral("assemblyTotalChapters"), assemblyTotalChapters);
    }
    return obj;
}

QJsonObject MissingRange::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("start"), start);
    obj.insert(QStringLiteral("end"), end);
    obj.insert(QStringLiteral("count"), count);
    return obj;
}

QJsonObject ResumeCheckResult::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("success"), success);
    if (!error.isEmpty()) {
        obj.insert(QStringLiteral("error"), error);
    }
    obj.insert(QStringLiteral("complete"), complete);
    obj.insert(QStringLiteral("canResume"), canResume);
    obj.insert(QStringLiteral("sessionId"), sessionId);
    obj.insert(QStringLiteral("sessionDir"), sessionDir);
    obj.insert(QStringLiteral("processDir"), processDir);
    obj.insert(QStringLiteral("sentencesDir"), sentencesDir);
    obj.insert(QStringLiteral("chaptersDir"), chaptersDir);
    obj.insert(QStringLiteral("sourceDocumentPath"), sourceDocumentPath);
    obj.insert(QStringLiteral("engineDocumentPath"), engineDocumentPath);
    obj.insert(QStringLiteral("totalUnits"), totalUnits);
    obj.insert(QStringLiteral("totalChapters"), totalChapters);
    obj.insert(QStringLiteral("completedUnits"), completedUnits);
    obj.insert(QStringLiteral("missingUnits"), missingUnits);
    obj.insert(QStringLiteral("missingIndices"), intArrayToJson(missingIndices));

    QJsonArray rangeArray;
    for (const MissingRange &range : missingRanges) {
        rangeArray.append(range.toJson());
    }
    obj.insert(QStringLiteral("missingRanges"), rangeArray);
    obj.insert(QStringLiteral("progressPercent"), progressPercent);
    obj.insert(QStringLiteral("chapters"), chaptersToJson(chapters));
    obj.insert(QStringLiteral("metadata"), metadata.toJson());
    return obj;
}

ResumeCheckResult ResumeCheckResult::fromJson(const QJsonObject &obj)
{
    ResumeCheckResult result;
    result.success = obj.value(QStringLiteral("success")).toBool();
    result.error = obj.value(QStringLiteral("error")).toString();
    result.complete = obj.value(QStringLiteral("complete")).toBool();
    result.canResume = obj.value(QStringLiteral("canResume")).toBool();
    result.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    result.sessionDir = obj.value(QStringLiteral("sessionDir")).toString();
    result.processDir = obj.value(QStringLiteral("processDir")).toString();
    result.sentencesDir = obj.value(QStringLiteral("sentencesDir")).toString();
    result.chaptersDir = obj.value(QStringLiteral("chaptersDir")).toString();
    result.sourceDocumentPath = obj.value(QStringLiteral("sourceDocumentPath")).toString();
    result.engineDocumentPath = obj.value(QStringLiteral("engineDocumentPath")).toString();
    result.totalUnits = obj.value(QStringLiteral("totalUnits")).toInt();
    result.totalChapters = obj.value(QStringLiteral("totalChapters")).toInt();
    result.completedUnits = obj.value(QStringLiteral("completedUnits")).toInt();
    result.missingUnits = obj.value(QStringLiteral("missingUnits")).toInt();
    result.missingIndices = intArrayFromJson(obj.value(QStringLiteral("missingIndices")).toArray());
    for (const QJsonValue &value : obj.value(QStringLiteral("missingRanges")).toArray()) {
        const QJsonObject rangeObj = value.toObject();
        MissingRange range;
        range.start = rangeObj.value(QStringLiteral("start")).toInt();
        range.end = rangeObj.value(QStringLiteral("end")).toInt();
        range.count = rangeObj.value(QStringLiteral("count")).toInt();
        result.missingRanges.append(range);
    }
    result.progressPercent = obj.value(QStringLiteral("progressPercent")).toInt();
    result.chapters = chaptersFromJson(obj.value(QStringLiteral("chapters")).toArray());
    result.metadata = DocumentMetadata::fromJson(obj.value(QStringLiteral("metadata")).toObject());
    return result;
}

QJsonObject ConversionAnalytics::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("jobId"), jobId);
    obj.insert(QStringLiteral("startedAt"), startedAt);
    obj.insert(QStringLiteral("completedAt"), completedAt);
    obj.insert(QStringLiteral("durationSeconds"), durationSeconds);
    obj.insert(QStringLiteral("totalSentences"), totalUnits);
    obj.insert(QStringLiteral("totalChapters"), totalChapters);
    obj.insert(QStringLiteral("workerCount"), workerCount);
    obj.insert(QStringLiteral("sentencesPerMinute"), unitsPerMinute);
    obj.insert(QStringLiteral("settings"), settings.toJson());
    obj.insert(QStringLiteral("success"), success);
    if (!outputPath.isEmpty()) {
        obj.insert(QStringLiteral("outputPath"), outputPath);
    }
    if (!error.isEmpty()) {
        obj.insert(QStringLiteral("error"), error);
    }
    obj.insert(QStringLiteral("isResumeJob"), isResume);
    obj.insert(QStringLiteral("sentencesProcessedInSession"), unitsProcessedInSession);
    obj.insert(QStringLiteral("failedWorkers"), failedWorkers);
    if (wasCancelled) {
        obj.insert(QStringLiteral("wasCancelled"), true);
        obj.insert(QStringLiteral("completedSentencesAtCancel"), completedUnitsAtCancel);
    }
    return obj;
}

QJsonObject ConversionResult::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("success"), success);
    if (!outputPath.isEmpty()) {
        obj.insert(QStringLiteral("outputPath"), outputPath);
    }
    if (error.isError()) {
        obj.insert(QStringLiteral("error"), error.toJson());
    }
    obj.insert(QStringLiteral("durationSeconds"), durationSeconds);
    obj.insert(QStringLiteral("failedWorkers"), failedWorkers);
    obj.insert(QStringLiteral("analytics"), analytics.toJson());
    return obj;
}

bool ConversionSession::advancePhase(ConversionPhase next)
{
    if (static_cast<int>(next) < static_cast<int>(phase)) {
        return false;
    }
    // Error 与 Complete 均为终态，互不覆盖
    if (phase == ConversionPhase::Complete || phase == ConversionPhase::Error) {
        return next == phase;
    }
    phase = next;
    return true;
}
