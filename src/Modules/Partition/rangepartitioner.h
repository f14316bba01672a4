#ifndef RANGEPARTITIONER_H
#define RANGEPARTITIONER_H

#include <QVector>

#include "../../Core/conversiontypes.h"

/// @brief 工作范围划分
/// @details 纯函数。区间连续、无空洞、互不重叠；每个区间至多 ceil(单元数 / workerCount) 个单元，
///          区间数取满足该上限的最少数目，各区间大小至多相差 1，较大的排在前面。
///          单元数少于 workerCount 时区间数也少于 workerCount，不会产生空区间；workerCount < 1 按 1 处理。
class RangePartitioner
{
public:
    /// @brief 按单元数划分
    /// @param totalUnits 单元总数（为 0 时返回空列表）
    /// @param workerCount 期望的工作进程数
    /// @return 覆盖 [0, totalUnits) 的闭区间列表，例如 (10, 3) -> [0,3] [4,6] [7,9]，
    ///         (6, 4) -> [0,1] [2,3] [4,5]
    static QVector<UnitRange> partitionUnits(int totalUnits, int workerCount);

    /// @brief 按章节划分
    /// @details 在章节号 1..N 上做同样的均衡划分；每个任务的单元区间取首章起点到末章终点。
    static QVector<WorkerAssignment> partitionChapters(const QVector<ChapterBoundary> &chapters, int workerCount);

    /// @brief 按缺失单元列表划分（续传）
    /// @details 对列表位置做均衡划分，每个任务携带自己的 assignedIndices，
    ///          units 为 [首个, 末个]。例如 ([2,5,6,7,19], 2) -> [2,5,6] [7,19]
    static QVector<WorkerAssignment> partitionIndexList(const QVector<int> &indices, int workerCount);

    // 普通单元区间转为任务
    static QVector<WorkerAssignment> toAssignments(const QVector<UnitRange> &ranges);

    /// @brief 将升序单元号压缩为连续区间
    static QVector<MissingRange> compressToRanges(const QVector<int> &sortedIndices);

private:
    // 在 [0, count) 的位置上做均衡切分
    static QVector<UnitRange> splitPositions(int count, int workerCount);
};

#endif // RANGEPARTITIONER_H
