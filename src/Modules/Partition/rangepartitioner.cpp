#include "rangepartitioner.h"

#include <algorithm>

QVector<UnitRange> RangePartitioner::splitPositions(int count, int workerCount)
{
    QVector<UnitRange> ranges;
    if (count <= 0) {
        return ranges;
    }

    // 每段至多 ceil(count / workerCount) 个，取能覆盖全部的最少段数
    const int workers = qMax(1, workerCount);
    const int perRange = (count + workers - 1) / workers;
    const int rangeCount = (count + perRange - 1) / perRange;
    const int baseSize = count / rangeCount;
    const int extra = count % rangeCount;

    ranges.reserve(rangeCount);
    int start = 0;
    for (int i = 0; i < rangeCount; ++i) {
        const int size = baseSize + (i < extra ? 1 : 0);
        UnitRange range;
        range.start = start;
        range.end = start + size - 1;
        ranges.append(range);
        start += size;
    }

    return ranges;
}

QVector<UnitRange> RangePartitioner::partitionUnits(int totalUnits, int workerCount)
{
    return splitPositions(totalUnits, workerCount);
}

QVector<WorkerAssignment> RangePartitioner::partitionChapters(const QVector<ChapterBoundary> &chapters, int workerCount)
{
    QVector<WorkerAssignment> assignments;

    QVector<ChapterBoundary> ordered = chapters;
    std::sort(ordered.begin(), ordered.end(), [](const ChapterBoundary &a, const ChapterBoundary &b) {
        return a.chapterNum < b.chapterNum;
    });

    const QVector<UnitRange> positions = splitPositions(ordered.size(), workerCount);
    assignments.reserve(positions.size());
    for (const UnitRange &position : positions) {
        const ChapterBoundary &first = ordered.at(position.start);
        const ChapterBoundary &last = ordered.at(position.end);

        WorkerAssignment assignment;
        assignment.chapterStart = first.chapterNum;
        assignment.chapterEnd = last.chapterNum;
        assignment.units.start = first.unitStart;
        assignment.units.end = last.unitEnd;
        assignments.append(assignment);
    }

    return assignments;
}

QVector<WorkerAssignment> RangePartitioner::partitionIndexList(const QVector<int> &indices, int workerCount)
{
    QVector<WorkerAssignment> assignments;

    QVector<int> sorted = indices;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    const QVector<UnitRange> positions = splitPositions(sorted.size(), workerCount);
    assignments.reserve(positions.size());
    for (const UnitRange &position : positions) {
        WorkerAssignment assignment;
        assignment.assignedIndices = sorted.mid(position.start, position.size());
        assignment.units.start = assignment.assignedIndices.first();
        assignment.units.end = assignment.assignedIndices.last();
        assignments.append(assignment);
    }

    return assignments;
}

QVector<WorkerAssignment> RangePartitioner::toAssignments(const QVector<UnitRange> &ranges)
{
    QVector<WorkerAssignment> assignments;
    assignments.reserve(ranges.size());
    for (const UnitRange &range : ranges) {
        WorkerAssignment assignment;
        assignment.units = range;
        assignments.append(assignment);
    }
    return assignments;
}

QVector<MissingRange> RangePartitioner::compressToRanges(const QVector<int> &sortedIndices)
{
    QVector<MissingRange> ranges;
    if (sortedIndices.isEmpty()) {
        return ranges;
    }

    MissingRange current;
    current.start = sortedIndices.first();
    current.end = current.start;
    for (int i = 1; i < sortedIndices.size(); ++i) {
        const int value = sortedIndices.at(i);
        if (value == current.end + 1) {
            current.end = value;
        } else if (value > current.end + 1) {
            current.count = current.end - current.start + 1;
            ranges.append(current);
            current.start = value;
            current.end = value;
        }
    }
    current.count = current.end - current.start + 1;
    ranges.append(current);

    return ranges;
}
