#ifndef PROGRESSAGGREGATOR_H
#define PROGRESSAGGREGATOR_H

#include "../../Core/conversiontypes.h"
#include "../../Core/coordinatorsettings.h"
#include "etaestimator.h"

/// @brief 会话进度聚合
/// @details 全新转换：已完成 = Σ completedUnits；
///          续传：已完成 = baselineCompleted + Σ actualConversions（基线只计一次）。
class ProgressAggregator
{
public:
    explicit ProgressAggregator(const EtaTuning &tuning = EtaTuning());

    /// @brief 生成当前快照
    /// @details 首次出现本次完成的单元时写入 session.firstUnitCompletedAtMs。
    AggregatedProgress aggregate(ConversionSession &session, qint64 nowMs);

    // 仅计算完成数，不更新 ETA 样本
    static int completedUnits(const ConversionSession &session);
    static int completedInSession(const ConversionSession &session);

    void reset();

private:
    EtaEstimator m_estimator;
};

#endif // PROGRESSAGGREGATOR_H
