#ifndef OUTPUTRELOCATOR_H
#define OUTPUTRELOCATOR_H

#include <QString>

/// @brief 成品文件定位与重命名
class OutputRelocator
{
public:
    /// @brief 在目录中查找最近修改的成品文件
    /// @details 跳过以 "._" 开头的 macOS 资源分叉文件
    static QString findLatestOutput(const QString &outputDir, const QString &extension = QStringLiteral("m4b"));

    // 文件名缺少扩展名时补上（大小写不敏感）
    static QString ensureExtension(const QString &fileName, const QString &extension = QStringLiteral("m4b"));

    /// @brief 已存在时依次尝试 "Name 2.ext"、"Name 3.ext" ...
    static QString uniqueFilePath(const QString &filePath);

    /// @brief 移动文件；跨文件系统时退回复制后删除
    static bool moveFile(const QString &fromPath, const QString &toPath, QString *errorMessage = nullptr);

    /// @brief 查找与成品同名的字幕文件
    /// @details 引擎常把空格写成下划线：去掉 _ - . 后长度大于 2 的词，匹配一半以上即视为同一本书；
    ///          或字幕名包含成品名（空格换成下划线）。
    static QString findMatchingSubtitle(const QString &outputPath, const QString &extension = QStringLiteral("m4b"));

    /// @brief 将匹配的字幕移动到 <新目录>/vtt/<新文件名>.vtt
    /// @param movedTo 移动后的字幕路径（没有字幕时为空）
    /// @return 没有字幕或移动成功返回 true
    static bool moveSubtitle(const QString &originalOutputPath,
                             const QString &newOutputPath,
                             QString *movedTo = nullptr,
                             QString *errorMessage = nullptr,
                             const QString &extension = QStringLiteral("m4b"));

    /// @brief 按用户指定的文件名重命名到输出目录，并同步移动字幕
    /// @param newPath 最终路径
    static bool relocate(const QString &inputPath,
                         const QString &outputDir,
                         const QString &outputFilename,
                         QString *newPath,
                         QString *errorMessage = nullptr,
                         const QString &extension = QStringLiteral("m4b"));
};

#endif // OUTPUTRELOCATOR_H
