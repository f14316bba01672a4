#ifndef METADATATAGGER_H
#define METADATATAGGER_H

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "../../Core/conversiontypes.h"

/// @brief 外部标签工具信息
struct MetadataToolInfo
{
    enum class Kind
    {
        M4bTool,
        Tone
    };

    Kind kind = Kind::M4bTool;
    QString path;

    bool isValid() const { return !path.isEmpty(); }
    QString name() const;
};

/// @brief 有声书标签写入
/// @details 封装 m4b-tool（meta 子命令）与 tone（tag 子命令）两种参数方言。
///          工具在事件循环中异步运行，结束、失败、超时或取消都以 finished 信号报告；
///          同一时刻只运行一个工具进程。
class MetadataTagger : public QObject
{
    Q_OBJECT
public:
    explicit MetadataTagger(const MetadataToolInfo &tool, int timeoutMs = 120000, QObject *parent = nullptr);
    ~MetadataTagger() override;

    const MetadataToolInfo &tool() const;

    /// @brief 查找标签工具
    /// @param preferred "auto"、"m4b-tool" 或 "tone"
    /// @param explicitPath 配置中指定的可执行文件路径（优先）
    /// @return 未找到时返回 path 为空的结果
    static MetadataToolInfo resolveTool(const QString &preferred, const QString &explicitPath = QString());

    // 去除内嵌封面的参数
    static QStringList buildRemoveCoverArgs(MetadataToolInfo::Kind kind, const QString &filePath);

    /// @brief 写入标题/作者/年份/封面的参数
    /// @return 没有任何可写字段时返回空列表
    static QStringList buildApplyMetadataArgs(MetadataToolInfo::Kind kind,
                                              const QString &filePath,
                                              const OutputMetadata &metadata);

    bool isRunning() const;

    /// @brief 启动去封面
    /// @return 未能启动时返回 false 并给出原因，不会再发出 finished
    bool startRemoveCover(const QString &filePath, QString *errorMessage = nullptr);

    /// @brief 启动写标签
    /// @details 没有可写字段时不启动工具，稍后直接以成功结束。
    bool startApplyMetadata(const QString &filePath, const OutputMetadata &metadata, QString *errorMessage = nullptr);

    /// @brief 结束正在运行的工具，随后以失败发出 finished
    void cancel();

signals:
    void finished(bool success, const QString &errorMessage);

private slots:
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessErrorOccurred(QProcess::ProcessError error);
    void onTimeout();

private:
    bool startTool(const QStringList &args, QString *errorMessage);
    void stopProcess();
    void finish(bool success, const QString &errorMessage);

    MetadataToolInfo m_tool;
    QProcess *m_process = nullptr;
    QTimer *m_timeoutTimer = nullptr;
    bool m_timedOut = false;
    bool m_cancelRequested = false;
    bool m_finished = true;
};

#endif // METADATATAGGER_H
