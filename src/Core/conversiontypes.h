#ifndef CONVERSIONTYPES_H
#define CONVERSIONTYPES_H

#include <QJsonArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

#include "coordinatorerror.h"

enum class PartitionMode
{
    Sentences,
    Chapters
};

enum class WorkerStatus
{
    Pending,
    Running,
    Complete,
    Error
};

enum class WorkerFailureReason
{
    None,
    ExitCode,
    SpawnFailure,
    Stalled,
    Cancelled
};

/// @brief 会话阶段，只允许单调前进
enum class ConversionPhase
{
    Preparing,
    Converting,
    Assembling,
    Enhancing,
    Complete,
    Error
};

/// @brief 合成阶段的子阶段（整体进度分段：0-60 / 60-70 / 70-95 / 95-100）
enum class AssemblySubPhase
{
    None,
    Combining,
    Subtitles,
    Encoding,
    Metadata
};

QString partitionModeName(PartitionMode mode);
PartitionMode partitionModeFromName(const QString &name, bool *ok = nullptr);
QString workerStatusName(WorkerStatus status);
QString workerFailureReasonName(WorkerFailureReason reason);
QString conversionPhaseName(ConversionPhase phase);
QString assemblySubPhaseName(AssemblySubPhase subPhase);

/// @brief 章节边界（章节号从 1 开始，单元区间为闭区间）
struct ChapterBoundary
{
    int chapterNum = 0;
    int unitStart = 0;
    int unitEnd = -1;
    int unitCount = 0;

    QJsonObject toJson() const;
    static ChapterBoundary fromJson(const QJsonObject &obj);
};

struct DocumentMetadata
{
    QString title;
    QString creator;
    QString language;

    QJsonObject toJson() const;
    static DocumentMetadata fromJson(const QJsonObject &obj);
};

/// @brief 预处理结果，一次全新转换只生成一次
struct PrepInfo
{
    QString sessionId;
    QString sessionDir;
    QString processDir;
    QString chaptersDir;
    QString sentencesDir;
    // 用户的原始文档（source_epub_path，缺失时同 epub_path）
    QString sourceDocumentPath;
    // 引擎实际读取的文档（epub_path）
    QString engineDocumentPath;
    int totalUnits = 0;
    int totalChapters = 0;
    QVector<ChapterBoundary> chapters;
    DocumentMetadata metadata;

    // 记录的全部文档路径（去空、去重）
    QStringList documentPaths() const;

    QJsonObject toJson() const;
};

/// @brief 闭区间 [start, end]
struct UnitRange
{
    int start = 0;
    int end = -1;

    int size() const { return end >= start ? end - start + 1 : 0; }
    bool isEmpty() const { return end < start; }
    bool contains(int unit) const { return unit >= start && unit <= end; }

    bool operator==(const UnitRange &other) const { return start == other.start && end == other.end; }
    bool operator!=(const UnitRange &other) const { return !(*this == other); }
};

/// @brief 单个工作进程的任务范围
/// @details units 始终有效（用于进度换算）；章节模式额外携带 chapterStart/chapterEnd；
///          续传模式携带显式的 assignedIndices。
struct WorkerAssignment
{
    UnitRange units;
    int chapterStart = 0;
    int chapterEnd = 0;
    QVector<int> assignedIndices;

    bool isChapterMode() const { return chapterStart > 0 && chapterEnd >= chapterStart; }
    bool hasIndexList() const { return !assignedIndices.isEmpty(); }

    /// @brief 该工作进程需要处理的单元数
    int unitCount() const;

    /// @brief 第 offset 个（从 0 开始）被处理单元对应的全局单元号
    int unitAt(int offset) const;

    QJsonObject toJson() const;
};

/// @brief 工作进程运行状态（可序列化部分，进程句柄由 WorkerSupervisor 持有）
struct WorkerState
{
    int id = 0;
    WorkerAssignment assignment;
    int currentUnit = 0;
    int completedUnits = 0;
    WorkerStatus status = WorkerStatus::Pending;
    int retryCount = 0;
    qint64 pid = 0;
    int exitCode = 0;
    QString errorMessage;
    WorkerFailureReason failureReason = WorkerFailureReason::None;
    qint64 startedAtMs = 0;
    qint64 lastProgressAtMs = 0;
    bool hasShownProgress = false;
    int actualConversions = 0;
    bool permanentlyFailed = false;

    bool isActive() const { return status == WorkerStatus::Pending || status == WorkerStatus::Running; }

    QJsonObject toJson() const;
};

struct EngineSettings
{
    QString device = QStringLiteral("cpu");
    QString language = QStringLiteral("en");
    QString ttsEngine = QStringLiteral("xtts");
    QString fineTuned;
    bool enableTextSplitting = false;

    QJsonObject toJson() const;
    static EngineSettings fromJson(const QJsonObject &obj);
};

/// @brief 调用方提供的成品元数据（全部为空时跳过后处理）
struct OutputMetadata
{
    QString title;
    QString author;
    QString year;
    QString coverPath;
    QString outputFilename;

    bool isEmpty() const;

    QJsonObject toJson() const;
    static OutputMetadata fromJson(const QJsonObject &obj);
};

struct ConversionConfig
{
    int workerCount = 1;
    QString documentPath;
    QString outputDir;
    PartitionMode partitionMode = PartitionMode::Sentences;
    EngineSettings engine;
    OutputMetadata metadata;

    QJsonObject toJson() const;
    static ConversionConfig fromJson(const QJsonObject &obj);
};

/// @brief 对外推送的聚合进度快照，不落盘
struct AggregatedProgress
{
    ConversionPhase phase = ConversionPhase::Preparing;
    int totalUnits = 0;
    int completedUnits = 0;
    int completedInSession = 0;
    int percentage = 0;
    int activeWorkers = 0;
    QVector<WorkerState> workers;
    int estimatedRemainingSeconds = -1;
    QString message;
    QString error;

    AssemblySubPhase assemblySubPhase = AssemblySubPhase::None;
    int assemblyProgress = 0;
    int assemblyChapter = 0;
    int assemblyTotalChapters = 0;

    bool hasEstimate() const { return estimatedRemainingSeconds >= 0; }

    QJsonObject toJson() const;
};

struct MissingRange
{
    int start = 0;
    int end = -1;
    int count = 0;

    bool operator==(const MissingRange &other) const
    {
        return start == other.start && end == other.end && count == other.count;
    }

    QJsonObject toJson() const;
};

/// @brief 续传检查结果（磁盘证据）
struct ResumeCheckResult
{
    bool success = false;
    QString error;
    bool complete = false;
    bool canResume = false;

    QString sessionId;
    QString sessionDir;
    QString processDir;
    QString sentencesDir;
    QString chaptersDir;
    QString sourceDocumentPath;
    QString engineDocumentPath;

    int totalUnits = 0;
    int totalChapters = 0;
    int completedUnits = 0;
    int missingUnits = 0;
    QVector<int> missingIndices;
    QVector<MissingRange> missingRanges;
    int progressPercent = 0;
    QVector<ChapterBoundary> chapters;
    DocumentMetadata metadata;

    QJsonObject toJson() const;
    static ResumeCheckResult fromJson(const QJsonObject &obj);
};

struct ConversionAnalytics
{
    QString jobId;
    QString startedAt;
    QString completedAt;
    int durationSeconds = 0;
    int totalUnits = 0;
    int totalChapters = 0;
    int workerCount = 0;
    double unitsPerMinute = 0.0;
    EngineSettings settings;
    bool success = false;
    QString outputPath;
    QString error;
    bool isResume = false;
    int unitsProcessedInSession = 0;
    int failedWorkers = 0;
    bool wasCancelled = false;
    int completedUnitsAtCancel = 0;

    QJsonObject toJson() const;
};

struct ConversionResult
{
    bool success = false;
    QString outputPath;
    CoordinatorError error;
    int durationSeconds = 0;
    int failedWorkers = 0;
    ConversionAnalytics analytics;

    QJsonObject toJson() const;
};

/// @brief 会话聚合根：一次转换（全新或续传）的全部协调状态
struct ConversionSession
{
    QString jobId;
    ConversionConfig config;
    PrepInfo prepInfo;
    QVector<WorkerState> workers;
    qint64 startTimeMs = 0;
    bool cancelled = false;
    ConversionPhase phase = ConversionPhase::Preparing;
    bool isResume = false;
    int baselineCompleted = 0;
    int totalMissing = 0;
    qint64 firstUnitCompletedAtMs = 0;

    /// @brief 推进阶段；目标阶段早于当前阶段时忽略并返回 false
    bool advancePhase(ConversionPhase next);
};

Q_DECLARE_METATYPE(AggregatedProgress)
Q_DECLARE_METATYPE(ConversionResult)
Q_DECLARE_METATYPE(PrepInfo)
Q_DECLARE_METATYPE(WorkerState)

#endif // CONVERSIONTYPES_H
