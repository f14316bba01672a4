#ifndef ASSEMBLYOUTPUTPARSER_H
#define ASSEMBLYOUTPUTPARSER_H

#include <QString>

#include "../../Core/conversiontypes.h"

/// @brief 合成进度快照
struct AssemblyProgress
{
    AssemblySubPhase subPhase = AssemblySubPhase::Combining;
    int subProgress = 0;
    int overallPercent = 0;
    int chapter = 0;
    int totalChapters = 0;
    QString message;
};

/// @brief 合成阶段输出解析
/// @details 逐行识别子阶段与子进度：
///          "[ASSEMBLE] Chapter N:"、"Assemble - X%" -> 合并章节；
///          "Creating VTT" / "[VTT]" 及其步骤提示 -> 字幕；
///          "Export - X%" -> 编码；
///          以及成品路径回显。子阶段只前进不后退。
class AssemblyOutputParser
{
public:
    explicit AssemblyOutputParser(int totalChapters = 0,
                                  const QString &outputExtension = QStringLiteral("m4b"));

    /// @brief 解析一行输出
    /// @return 进度状态是否发生变化
    bool processLine(const QString &line);

    AssemblySubPhase subPhase() const;
    int subProgress() const;
    int currentChapter() const;
    int totalChapters() const;
    QString detectedOutputPath() const;

    // 整体百分比：合并 0-60，字幕 60-70，编码 70-95，元数据 95-100
    int overallPercent() const;
    static int overallPercent(AssemblySubPhase subPhase, int subProgress);

    // 当前子阶段的展示文本
    QString message() const;

    AssemblyProgress snapshot() const;

    /// @brief 进入元数据子阶段（后处理开始时由协调器调用）
    void enterMetadataPhase(int subProgress = 0);

private:
    void setSubProgress(AssemblySubPhase subPhase, int progress);

    int m_totalChapters = 0;
    QString m_outputExtension;
    AssemblySubPhase m_subPhase = AssemblySubPhase::Combining;
    int m_subProgress = 0;
    int m_currentChapter = 0;
    QString m_overrideMessage;
    QString m_outputPath;
};

#endif // ASSEMBLYOUTPUTPARSER_H
