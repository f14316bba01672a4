#include "coordinatorerror.h"

namespace {
constexpr int kMaxOutputTailChars = 32 * 1024;
}

QString CoordinatorError::kindName() const
{
    switch (kind) {
    case CoordinatorErrorKind::None:
        return QStringLiteral("none");
    case CoordinatorErrorKind::Preparation:
        return QStringLiteral("preparation");
    case CoordinatorErrorKind::Worker:
        return QStringLiteral("worker");
    case CoordinatorErrorKind::PermanentWorkerFailure:
        return QStringLiteral("permanent_worker_failure");
    case CoordinatorErrorKind::Stall:
        return QStringLiteral("stall");
    case CoordinatorErrorKind::Assembly:
        return QStringLiteral("assembly");
    case CoordinatorErrorKind::PostProcessing:
        return QStringLiteral("post_processing");
    case CoordinatorErrorKind::Configuration:
        return QStringLiteral("configuration");
    case CoordinatorErrorKind::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QJsonObject CoordinatorError::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("kind"), kindName());
    obj.insert(QStringLiteral("message"), message);
    if (!details.isEmpty()) {
        obj.insert(QStringLiteral("details"), details);
    }
    if (exitCode != 0) {
        obj.insert(QStringLiteral("exitCode"), exitCode);
    }
    return obj;
}

CoordinatorError CoordinatorError::make(CoordinatorErrorKind kind,
                                        const QString &message,
                                        const QString &details,
                                        int exitCode)
{
    CoordinatorError error;
    error.kind = kind;
    error.message = message;
    error.details = boundedOutputTail(details);
    error.exitCode = exitCode;
    return error;
}

QString boundedOutputTail(const QString &output)
{
    if (output.size() <= kMaxOutputTailChars) {
        return output;
    }
    return output.right(kMaxOutputTailChars);
}
