#include "enginecommandbuilder.h"

QStringList EngineCommandBuilder::buildPrepArgs(const EngineLaunchSettings &launch,
                                                const QString &documentPath,
                                                const QString &sessionId,
                                                const EngineSettings &engine)
{
    QStringList args = launch.baseArguments();
    args << "--ebook" << documentPath
         << "--session" << sessionId
         << "--language" << engine.language
         << "--tts_engine" << engine.ttsEngine
         << "--device" << deviceArgument(engine.device)
         << "--prep_only";

    if (!engine.fineTuned.isEmpty()) {
        args << "--fine_tuned" << engine.fineTuned;
    }

    return args;
}

QStringList EngineCommandBuilder::buildWorkerArgs(const EngineLaunchSettings &launch,
                                                  const QString &sessionId,
                                                  const QString &outputDir,
                                                  const EngineSettings &engine,
                                                  const WorkerAssignment &assignment)
{
    QStringList args = launch.baseArguments();
    args << "--session" << sessionId
         << "--device" << deviceArgument(engine.device)
         << "--output_dir" << outputDir
         << "--worker_mode"
         << "--skip_deps"
         << "--tts_engine" << engine.ttsEngine;

    if (!engine.fineTuned.isEmpty()) {
        args << "--fine_tuned" << engine.fineTuned;
    }

    if (assignment.hasIndexList()) {
        args << "--sentence_indices" << joinIndices(assignment.assignedIndices);
    } else if (assignment.isChapterMode()) {
        args << "--chapter_start" << QString::number(assignment.chapterStart)
             << "--chapter_end" << QString::number(assignment.chapterEnd);
    } else {
        args << "--sentence_start" << QString::number(assignment.units.start)
             << "--sentence_end" << QString::number(assignment.units.end);
    }

    if (engine.enableTextSplitting) {
        args << "--enable_text_splitting";
    }

    return args;
}

QStringList EngineCommandBuilder::buildAssemblyArgs(const EngineLaunchSettings &launch,
                                                    const QString &documentPath,
                                                    const QString &outputDir,
                                                    const QString &sessionId,
                                                    const EngineSettings &engine)
{
    QStringList args = launch.baseArguments();
    args << "--ebook" << documentPath
         << "--output_dir" << outputDir
         << "--session" << sessionId
         << "--device" << deviceArgument(engine.device)
         << "--language" << engine.language
         << "--tts_engine" << engine.ttsEngine
         << "--assemble_only"
         << "--skip_deps"
         << "--no_split";
    return args;
}

QString EngineCommandBuilder::deviceArgument(const QString &device)
{
    const QString normalized = device.trimmed().toLower();
    if (normalized == QLatin1String("gpu") || normalized == QLatin1String("cuda")) {
        return QStringLiteral("CUDA");
    }
    if (normalized == QLatin1String("mps")) {
        return QStringLiteral("MPS");
    }
    return QStringLiteral("CPU");
}

QProcessEnvironment EngineCommandBuilder::engineEnvironment()
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("PYTHONUNBUFFERED"), QStringLiteral("1"));
    env.insert(QStringLiteral("PYTHONIOENCODING"), QStringLiteral("utf-8"));
    return env;
}

QString EngineCommandBuilder::joinIndices(const QVector<int> &indices)
{
    QStringList parts;
    parts.reserve(indices.size());
    for (int index : indices) {
        parts << QString::number(index);
    }
    return parts.join(',');
}
