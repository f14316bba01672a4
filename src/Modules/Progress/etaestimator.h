#ifndef ETAESTIMATOR_H
#define ETAESTIMATOR_H

#include <QPair>
#include <QVector>

#include "../../Core/coordinatorsettings.h"

/// @brief 剩余时间估算
/// @details 长期速率 = 本次已完成单元 / 首个单元完成以来的工作时长（排除模型加载）；
///          滑动窗口内样本足够且跨度足够时，与窗口速率按 longHorizonWeight 加权混合。
class EtaEstimator
{
public:
    struct Estimate
    {
        int remainingSeconds = -1;
        double unitsPerMinute = -1.0;

        bool hasEta() const { return remainingSeconds >= 0; }
        bool hasRate() const { return unitsPerMinute >= 0.0; }
    };

    explicit EtaEstimator(const EtaTuning &tuning = EtaTuning());

    void reset();

    /// @brief 记录一个样本并计算估算值
    /// @param nowMs 当前时间
    /// @param doneInSession 本次会话内完成的单元数
    /// @param remainingUnits 剩余单元数
    /// @param workStartMs 首个单元完成时间（为 0 时无法估算）
    Estimate update(qint64 nowMs, int doneInSession, int remainingUnits, qint64 workStartMs);

    int sampleCount() const;

private:
    EtaTuning m_tuning;
    QVector<QPair<qint64, int>> m_samples;
};

#endif // ETAESTIMATOR_H
