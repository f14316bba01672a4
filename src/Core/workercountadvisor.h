#ifndef WORKERCOUNTADVISOR_H
#define WORKERCOUNTADVISOR_H

#include <QString>

struct WorkerCountRecommendation
{
    int count = 1;
    qint64 availableBytes = 0;
    QString reason;
};

/// @brief 按可用内存推荐并行工作进程数
/// @details 每个引擎进程约占 16 GiB，推荐值介于 1 到 2 之间。
class WorkerCountAdvisor
{
public:
    static constexpr qint64 kBytesPerWorker = 16LL * 1024 * 1024 * 1024;
    static constexpr int kMaxRecommendedWorkers = 2;

    static WorkerCountRecommendation recommend(qint64 availableBytes);

    // 读取本机可用内存后给出推荐
    static WorkerCountRecommendation recommendForThisMachine();

    /// @brief 读取可用内存（Linux 读取 /proc/meminfo 的 MemAvailable，失败返回 -1）
    static qint64 availableMemoryBytes();
};

#endif // WORKERCOUNTADVISOR_H
