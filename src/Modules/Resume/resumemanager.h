#ifndef RESUMEMANAGER_H
#define RESUMEMANAGER_H

#include <QSet>
#include <QString>
#include <QVector>

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorsettings.h"

/// @brief 续传管理
/// @details 只依据磁盘证据：会话状态文件给出单元总数，
///          chapters_dir_sentences 中的 <index>.<ext> 文件表示已完成的单元。
class ResumeManager
{
public:
    explicit ResumeManager(const CoordinatorSettings &settings);

    /// @brief 查找引用该文档的最近一次会话
    /// @return ebook-<id> 目录；未找到返回空字符串
    QString findSessionForDocument(const QString &documentPath) const;

    /// @brief 检查文档的续传状态
    /// @param documentPath 源文档路径
    /// @param sessionId 指定会话号时只检查该会话，否则按最近修改时间选择
    ResumeCheckResult checkResumeStatus(const QString &documentPath, const QString &sessionId = QString()) const;

    /// @brief 检查单个会话目录
    ResumeCheckResult inspectSession(const QString &sessionDir) const;

    // 会话根目录下全部可续传（未完成且已有进度）的会话，最近修改的在前
    QVector<ResumeCheckResult> listResumableSessions() const;

    /// @brief 续传证据缺少关键字段时重新从磁盘读取
    bool ensureEvidenceComplete(const QString &documentPath, ResumeCheckResult *evidence, QString *errorMessage = nullptr) const;

    /// @brief 依据证据构造续传会话
    /// @details 工作进程按缺失单元列表划分；baselineCompleted 取证据中的已完成数。
    ///          没有缺失单元时 workers 为空，调用方直接进入合成。
    bool buildResumeSession(const QString &jobId,
                            const ConversionConfig &config,
                            const ResumeCheckResult &evidence,
                            ConversionSession *session,
                            QString *errorMessage = nullptr) const;

    /// @brief 扫描已完成单元
    /// @param readable 目录是否可读
    static QSet<int> scanCompletedUnits(const QString &sentencesDir, const QString &extension, bool *readable = nullptr);

    // [0, totalUnits) 中不在 completed 内的单元，升序
    static QVector<int> computeMissing(int totalUnits, const QSet<int> &completed);

    // 两个路径是否指向同一文档
    static bool isSameDocument(const QString &left, const QString &right);

    // 会话记录的任一文档路径（原始文档或引擎副本）与 documentPath 相同
    static bool matchesDocument(const QStringList &recordedPaths, const QString &documentPath);

private:
    QStringList candidateSessionDirs() const;

    CoordinatorSettings m_settings;
};

#endif // RESUMEMANAGER_H
