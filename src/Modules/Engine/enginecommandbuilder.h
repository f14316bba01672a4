#ifndef ENGINECOMMANDBUILDER_H
#define ENGINECOMMANDBUILDER_H

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorsettings.h"

/// @brief 语音引擎命令行构造器
/// @details 三种模式共用 program + 前缀参数 + 脚本 + --headless，
///          之后分别追加预处理、工作进程与合成模式的参数。
class EngineCommandBuilder
{
public:
    /// @brief 构造预处理命令参数
    /// @param launch 引擎启动配置
    /// @param documentPath 源文档路径
    /// @param sessionId 预先生成的会话号
    /// @param engine 语音参数（语言、设备、引擎、音色）
    /// @return 完整参数列表（不含 program）
    static QStringList buildPrepArgs(const EngineLaunchSettings &launch,
                                     const QString &documentPath,
                                     const QString &sessionId,
                                     const EngineSettings &engine);

    /// @brief 构造工作进程命令参数
    /// @details 显式单元列表优先，其次章节区间，最后普通单元区间。
    static QStringList buildWorkerArgs(const EngineLaunchSettings &launch,
                                       const QString &sessionId,
                                       const QString &outputDir,
                                       const EngineSettings &engine,
                                       const WorkerAssignment &assignment);

    /// @brief 构造合成命令参数
    static QStringList buildAssemblyArgs(const EngineLaunchSettings &launch,
                                         const QString &documentPath,
                                         const QString &outputDir,
                                         const QString &sessionId,
                                         const EngineSettings &engine);

    /// @brief 设备名映射：gpu -> CUDA，mps -> MPS，其他 -> CPU
    static QString deviceArgument(const QString &device);

    // 引擎进程环境：关闭输出缓冲并固定 UTF-8 编码
    static QProcessEnvironment engineEnvironment();

    // 逗号分隔的单元列表
    static QString joinIndices(const QVector<int> &indices);
};

#endif // ENGINECOMMANDBUILDER_H
