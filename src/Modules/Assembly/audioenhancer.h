#ifndef AUDIOENHANCER_H
#define AUDIOENHANCER_H

#include <QObject>
#include <QProcess>

#include "../../Core/coordinatorerror.h"
#include "../../Core/coordinatorsettings.h"

/// @brief 成品音质增强
/// @details 运行配置的增强程序（program + args + 成品路径），程序原地改写成品。
///          输出中 tqdm 风格的 "NN%|" 会作为进度上报。
///          失败时 enhancementFinished 仍给出原成品路径，由调用方决定是否当作警告。
class AudioEnhancer : public QObject
{
    Q_OBJECT
public:
    explicit AudioEnhancer(const EnhancementSettings &settings, QObject *parent = nullptr);
    ~AudioEnhancer() override;

    bool isRunning() const;

    /// @brief 启动增强
    /// @param filePath 成品路径
    void startEnhancement(const QString &filePath);

    /// @brief 强制结束增强进程树
    void cancel();

    // 从一行输出中解析百分比，没有时返回 -1
    static int parsePercent(const QString &line);

signals:
    void taskLog(const QString &line);
    void progressChanged(int percent);
    void enhancementFinished(bool success, const QString &outputPath, const CoordinatorError &error);

private slots:
    void onReadyReadOutput();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessErrorOccurred(QProcess::ProcessError error);

private:
    void processOutputLine(const QString &line);
    void finish(bool success, const CoordinatorError &error);

    EnhancementSettings m_settings;
    QProcess *m_process = nullptr;
    QString m_filePath;
    QString m_stdoutBuffer;
    QString m_outputTail;
    int m_lastPercent = -1;
    bool m_cancelRequested = false;
    bool m_finished = true;
};

#endif // AUDIOENHANCER_H
