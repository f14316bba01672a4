#ifndef COORDINATORERROR_H
#define COORDINATORERROR_H

#include <QJsonObject>
#include <QMetaType>
#include <QString>

/// @brief 协调器错误分类
enum class CoordinatorErrorKind
{
    None,
    Preparation,
    Worker,
    PermanentWorkerFailure,
    Stall,
    Assembly,
    PostProcessing,
    Configuration,
    Cancelled
};

/// @brief 协调器错误值
/// @details 同步接口通过 bool 返回值 + 输出参数传递，异步组件通过信号携带。
///          details 保存子进程输出尾部，便于定位引擎侧问题。
struct CoordinatorError
{
    CoordinatorErrorKind kind = CoordinatorErrorKind::None;
    QString message;
    QString details;
    int exitCode = 0;

    bool isError() const { return kind != CoordinatorErrorKind::None; }

    QString kindName() const;
    QJsonObject toJson() const;

    static CoordinatorError make(CoordinatorErrorKind kind,
                                 const QString &message,
                                 const QString &details = QString(),
                                 int exitCode = 0);
};

/// @brief 截取进程输出尾部（上限 32 KiB）
QString boundedOutputTail(const QString &output);

Q_DECLARE_METATYPE(CoordinatorError)

#endif // COORDINATORERROR_H
