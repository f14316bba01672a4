#ifndef SESSIONPREPARER_H
#define SESSIONPREPARER_H

#include <QObject>
#include <QProcess>

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorerror.h"
#include "../../Core/coordinatorsettings.h"

/// @brief 会话预处理执行器
/// @details 以 --prep_only 模式运行一次引擎，退出码为 0 后读取
///          <sessionsRoot>/ebook-<id>/<processDir>/session-state.json 生成 PrepInfo。
///          不解析标准输出，输出只转发为日志。
class SessionPreparer : public QObject
{
    Q_OBJECT
public:
    explicit SessionPreparer(const EngineLaunchSettings &launch, QObject *parent = nullptr);

    bool isRunning() const;
    QString sessionId() const;

    /// @brief 启动预处理
    /// @param documentPath 源文档路径
    /// @param engine 语音参数
    void startPreparation(const QString &documentPath, const EngineSettings &engine);

    /// @brief 取消预处理（强制结束进程树）
    void cancel();

    /// @brief 读取会话状态文件
    /// @param sessionDir ebook-<id> 目录
    /// @param info 输出结果
    /// @param errorMessage 失败原因
    /// @return 是否读取成功
    static bool readPrepInfo(const QString &sessionDir, PrepInfo *info, QString *errorMessage = nullptr);

    // <sessionsRoot>/ebook-<id>
    static QString sessionDirFor(const QString &sessionsRoot, const QString &sessionId);

    // 会话目录下状态文件最新且可用的处理目录（均不可用时取最新的一个）
    static QString findProcessDir(const QString &sessionDir);

    // 目录名去掉 ebook- 前缀即为会话号
    static QString sessionIdFromDirName(const QString &dirName);

signals:
    void preparationStarted(const QString &sessionId);
    void taskLog(const QString &line);
    void preparationFinished(bool success, const PrepInfo &info, const CoordinatorError &error);

private slots:
    void onReadyReadOutput();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessErrorOccurred(QProcess::ProcessError error);

private:
    void finishWithError(const CoordinatorError &error);

    EngineLaunchSettings m_launch;
    QProcess *m_process = nullptr;
    QString m_sessionId;
    QString m_documentPath;
    QString m_outputTail;
    QString m_stdoutBuffer;
    bool m_cancelRequested = false;
    bool m_finished = false;
};

#endif // SESSIONPREPARER_H
