#ifndef ASSEMBLYCOORDINATOR_H
#define ASSEMBLYCOORDINATOR_H

#include <QObject>
#include <QProcess>

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorerror.h"
#include "../../Core/coordinatorsettings.h"
#include "assemblyoutputparser.h"
#include "metadatatagger.h"

struct AssemblyRequest
{
    QString documentPath;
    QString outputDir;
    QString sessionId;
    EngineSettings engine;
    OutputMetadata metadata;
    int totalChapters = 0;
};

/// @brief 合成阶段执行器
/// @details 以 --assemble_only 模式运行引擎，跟踪合并/字幕/编码/元数据四个子阶段。
///          退出后定位成品：优先使用输出中回显的路径，否则取输出目录中最近修改的成品文件。
///          即使退出码非 0，只要找到成品仍按成功处理。
///          随后异步执行后处理（去封面、写标签、重命名、移动字幕），失败不影响结果，只记录警告；
///          cancel() 同样会结束正在运行的标签工具。
class AssemblyCoordinator : public QObject
{
    Q_OBJECT
public:
    explicit AssemblyCoordinator(const CoordinatorSettings &settings, QObject *parent = nullptr);
    ~AssemblyCoordinator() override;

    bool isRunning() const;

    /// @brief 启动合成
    void startAssembly(const AssemblyRequest &request);

    /// @brief 取消合成（强制结束进程树）
    void cancel();

    AssemblyProgress currentProgress() const;

signals:
    void taskLog(const QString &line);
    void progressChanged(const AssemblyProgress &progress);
    void assemblyFinished(bool success, const QString &outputPath, const CoordinatorError &error);

private slots:
    void onReadyReadOutput();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessErrorOccurred(QProcess::ProcessError error);
    void onTaggerFinished(bool success, const QString &errorMessage);

private:
    enum class PostStep
    {
        None,
        RemoveCover,
        ApplyMetadata
    };

    void beginPostProcessing(const QString &outputPath);
    void startApplyMetadataStep();
    void relocateAndFinish();
    void processOutputLine(const QString &line);
    QString locateOutput() const;
    void finish(bool success, const QString &outputPath, const CoordinatorError &error);

    CoordinatorSettings m_settings;
    QProcess *m_process = nullptr;
    AssemblyRequest m_request;
    AssemblyOutputParser m_parser;
    QString m_stdoutBuffer;
    QString m_outputTail;
    MetadataTagger *m_tagger = nullptr;
    PostStep m_postStep = PostStep::None;
    QString m_outputPath;
    bool m_cancelRequested = false;
    bool m_finished = true;
};

#endif // ASSEMBLYCOORDINATOR_H
