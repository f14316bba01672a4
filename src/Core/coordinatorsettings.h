#ifndef COORDINATORSETTINGS_H
#define COORDINATORSETTINGS_H

#include <QString>
#include <QStringList>

class QSettings;

/// @brief 语音引擎启动方式
/// @details 完整命令为 program + prefixArgs + script + "--headless" + 模式参数。
struct EngineLaunchSettings
{
    QString program = QStringLiteral("python");
    QStringList prefixArgs;
    QString script = QStringLiteral("app.py");
    QString workingDirectory;
    QString sessionsRoot;

    // 引擎的 tmp 目录；未显式配置时取 workingDirectory/tmp
    QString resolvedSessionsRoot() const;
    // 引擎调用的公共前缀参数
    QStringList baseArguments() const;
};

struct WatchdogTimeouts
{
    int intervalMs = 30 * 1000;
    qint64 startupTimeoutMs = 10 * 60 * 1000;
    qint64 progressTimeoutMs = 5 * 60 * 1000;
};

/// @brief 剩余时间估算参数
struct EtaTuning
{
    qint64 windowMs = 30 * 1000;
    int minSamples = 3;
    qint64 minElapsedMs = 10 * 1000;
    qint64 minWindowSpanMs = 5 * 1000;
    double longHorizonWeight = 0.7;
};

/// @brief 合成后的音质增强
/// @details 命令为 program + args + 成品路径，工具原地改写成品。
///          只对 engines 中列出的语音引擎生效；失败不影响转换结果。
struct EnhancementSettings
{
    bool enabled = false;
    QString program;
    QStringList args;
    QStringList engines = QStringList{QStringLiteral("orpheus")};

    // 已启用、配置了程序且引擎在列表中
    bool appliesTo(const QString &ttsEngine) const;
};

/// @brief 协调器配置
/// @details 从 QSettings（默认组织/应用名 qTtsPool，或显式 INI 文件）读取，
///          读取后统一做范围校验。
struct CoordinatorSettings
{
    EngineLaunchSettings engine;

    QString metadataTool = QStringLiteral("auto");
    QString metadataToolPath;
    int metadataTimeoutMs = 120 * 1000;

    EnhancementSettings enhancement;

    QString outputExtension = QStringLiteral("m4b");
    QString sentenceExtension = QStringLiteral("flac");

    int maxWorkerRetries = 2;
    WatchdogTimeouts watchdog;
    EtaTuning eta;

    QString logsDirectory;

    /// @brief 从 QSettings 读取，缺失项保留默认值
    static CoordinatorSettings load(QSettings &settings);

    /// @brief 从用户级默认配置读取
    static CoordinatorSettings loadDefault();

    /// @brief 从 INI 文件读取
    /// @param filePath INI 文件路径
    /// @param errorMessage 文件不存在或格式错误时的说明
    /// @param ok 是否读取成功
    static CoordinatorSettings loadFromFile(const QString &filePath, QString *errorMessage = nullptr, bool *ok = nullptr);

    void save(QSettings &settings) const;

    // 日志目录；未配置时使用当前目录下的 logs
    QString resolvedLogsDirectory() const;

    // 将越界值收敛到合法范围
    void normalize();
};

#endif // COORDINATORSETTINGS_H
