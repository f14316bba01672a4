#ifndef PROGRESSLINEPARSER_H
#define PROGRESSLINEPARSER_H

#include <QString>

/// @brief 单行进度解析结果
struct UnitProgress
{
    double percent = 0.0;
    int current = 0;
    int total = 0;
};

/// @brief 引擎输出行解析接口
/// @details 不同语音引擎的进度文本格式不同，工作进程监管只依赖此接口。
class ProgressLineParser
{
public:
    virtual ~ProgressLineParser() = default;

    /// @brief 解析一行进度
    /// @param line 已去除换行的输出行
    /// @param progress 解析结果（仅在返回 true 时写入）
    /// @return 是否为进度行
    virtual bool parseProgressLine(const QString &line, UnitProgress *progress) const = 0;

    /// @brief 是否为续传时的"补齐缺失单元"标记行
    virtual bool isRecoveryMarker(const QString &line) const = 0;
};

/// @brief ebook2audiobook 输出格式
/// @details 进度行形如 "Converting 45.2%: 120/265"，大小写不敏感；
///          续传时每合成一个缺失句子会输出 "Recovering missing sentence N"。
class Ebook2AudiobookProgressParser : public ProgressLineParser
{
public:
    bool parseProgressLine(const QString &line, UnitProgress *progress) const override;
    bool isRecoveryMarker(const QString &line) const override;
};

#endif // PROGRESSLINEPARSER_H
