//
// UmlRenderCache
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include "RenderInvoker.h"

#include "RenderErrors.h"
#include "core/CommandResolver.h"
#include "logging_categories.h"

#include <QElapsedTimer>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>

namespace {

// Poll interval while draining; QProcess services stdin/stdout/stderr during each wait.
constexpr int kDrainSliceMs = 100;

QString exitDescription(const RenderInvoker::ProcessOutcome& outcome)
{
    if (outcome.exitStatus == QProcess::CrashExit) {
        return QStringLiteral("PlantUML crashed (exit code %1)").arg(outcome.exitCode);
    }
    return QStringLiteral("PlantUML exited with code %1").arg(outcome.exitCode);
}

} // namespace

RenderInvoker::RenderInvoker(const RendererSettings& settings, const QString& basePath)
    : m_settings(settings)
    , m_basePath(basePath)
{
}

void RenderInvoker::setSettings(const RendererSettings& settings)
{
    QMutexLocker locker(&m_mutex);
    m_settings = settings;
}

RendererSettings RenderInvoker::settings() const
{
    QMutexLocker locker(&m_mutex);
    return m_settings;
}

QFuture<QString> RenderInvoker::renderArtifact(const QString& source, OutputKind kind, const QString& workingDir)
{
    return QtConcurrent::run([this, source, kind, workingDir]() -> QString {
        return runArtifact(source, kind, workingDir);
    });
}

QFuture<QString> RenderInvoker::renderMap(const QString& source, const QString& workingDir)
{
    return QtConcurrent::run([this, source, workingDir]() -> QString {
        return runMap(source, workingDir);
    });
}

QString RenderInvoker::runArtifact(const QString& source, OutputKind kind, const QString& workingDir) const
{
    const RendererSettings snapshot = settings();
    RendererCommand command = CommandResolver::resolve(snapshot, m_basePath);
    command.arguments << (QStringLiteral("-t") + outputKindFormatFlag(kind))
                      << QString::fromLatin1(kPipeFlag);

    const ProcessOutcome outcome = runProcess(command.program, command.arguments, source.toUtf8(),
                                              workingDir, snapshot.processTimeoutMs);
    return interpretArtifact(outcome, kind);
}

QString RenderInvoker::runMap(const QString& source, const QString& workingDir) const
{
    const RendererSettings snapshot = settings();
    RendererCommand command = CommandResolver::resolve(snapshot, m_basePath);
    command.arguments << QString::fromLatin1(kPipeMapFlag);

    const ProcessOutcome outcome = runProcess(command.program, command.arguments, source.toUtf8(),
                                              workingDir, snapshot.processTimeoutMs);
    return interpretMap(outcome);
}

RenderInvoker::ProcessOutcome RenderInvoker::runProcess(const QString& program,
                                                        const QStringList& arguments,
                                                        const QByteArray& stdinBytes,
                                                        const QString& workingDir,
                                                        int timeoutMs)
{
    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.setProgram(program);
    proc.setArguments(arguments);
    if (!workingDir.isEmpty()) {
        proc.setWorkingDirectory(workingDir);
    }

    qCInfo(urc_process) << "RenderInvoker: program =" << program << ", args =" << arguments
                        << ", cwd =" << workingDir;

    // Arguments are passed as a list (no shell), so paths with spaces need no quoting.
    proc.start();
    if (!proc.waitForStarted(-1)) {
        const QString err = QStringLiteral("Failed to start renderer '%1': %2").arg(program, proc.errorString());
        qCWarning(urc_process) << "RenderInvoker:" << err
                               << ", qprocess error =" << static_cast<int>(proc.error());
        throw LaunchError(err);
    }
    qCDebug(urc_process) << "RenderInvoker: process started, pid =" << static_cast<qint64>(proc.processId());

    // Queue stdin and close it; QProcess flushes the buffer while we wait below.
    if (!stdinBytes.isEmpty()) {
        proc.write(stdinBytes);
    }
    proc.closeWriteChannel();

    ProcessOutcome outcome;
    QByteArray diagnosticBytes;
    QElapsedTimer timer;
    timer.start();

    while (proc.state() != QProcess::NotRunning) {
        proc.waitForFinished(kDrainSliceMs);
        outcome.output += proc.readAllStandardOutput();
        diagnosticBytes += proc.readAllStandardError();

        if (timeoutMs > 0 && timer.elapsed() >= timeoutMs && proc.state() != QProcess::NotRunning) {
            qCWarning(urc_process) << "RenderInvoker: renderer timed out after" << timeoutMs << "ms, killing...";
            proc.kill();
            proc.waitForFinished(-1);
            proc.readAllStandardOutput();
            proc.readAllStandardError();
            throw RenderError(QStringLiteral("PlantUML timed out after %1 ms").arg(timeoutMs), -1,
                              QString::fromUtf8(diagnosticBytes));
        }
    }

    // Pick up anything that arrived between the last read and process exit.
    outcome.output += proc.readAllStandardOutput();
    diagnosticBytes += proc.readAllStandardError();

    outcome.diagnostics = QString::fromUtf8(diagnosticBytes);
    outcome.exitCode = proc.exitCode();
    outcome.exitStatus = proc.exitStatus();

    qCInfo(urc_process) << "RenderInvoker: process finished, exitCode =" << outcome.exitCode
                        << ", exitStatus =" << (outcome.exitStatus == QProcess::NormalExit ? "NormalExit" : "CrashExit")
                        << ", stdout bytes =" << outcome.output.size()
                        << ", stderr bytes =" << diagnosticBytes.size();
    return outcome;
}

QString RenderInvoker::interpretArtifact(const ProcessOutcome& outcome, OutputKind kind)
{
    const bool hasOutput = !outcome.output.isEmpty();
    const bool isBinary = kind == OutputKind::Png;

    if (outcome.exitedCleanly()) {
        if (!hasOutput) {
            // Usually Graphviz is missing rather than the diagram being empty.
            const QString trimmed = outcome.diagnostics.trimmed();
            const QString msg = trimmed.isEmpty() ? QStringLiteral("No output from PlantUML") : trimmed;
            qCWarning(urc_process).noquote() << "RenderInvoker: PlantUML error:" << msg;
            throw RenderError(msg, outcome.exitCode, outcome.diagnostics);
        }
        return isBinary ? QString::fromLatin1(outcome.output.toBase64())
                        : QString::fromUtf8(outcome.output);
    }

    if (hasOutput && isBinary) {
        qCWarning(urc_process).noquote() << "RenderInvoker:" << exitDescription(outcome)
                                         << "but produced an image; returning it";
        return QString::fromLatin1(outcome.output.toBase64());
    }

    QString msg = outcome.diagnostics.trimmed();
    if (msg.isEmpty() && hasOutput) {
        msg = QString::fromUtf8(outcome.output).trimmed();
    }
    if (msg.isEmpty()) {
        msg = exitDescription(outcome);
    }
    qCWarning(urc_process).noquote() << "RenderInvoker: PlantUML error (code" << outcome.exitCode << "):" << msg;
    throw RenderError(msg, outcome.exitCode, outcome.diagnostics);
}

QString RenderInvoker::interpretMap(const ProcessOutcome& outcome)
{
    if (outcome.exitedCleanly()) {
        return QString::fromUtf8(outcome.output);
    }

    QString msg = outcome.diagnostics.trimmed();
    if (msg.isEmpty()) {
        msg = QString::fromUtf8(outcome.output).trimmed();
    }
    if (msg.isEmpty()) {
        msg = QStringLiteral("PlantUML map generation exited with code %1").arg(outcome.exitCode);
    }
    qCWarning(urc_process).noquote() << "RenderInvoker: PlantUML map generation error (code"
                                     << outcome.exitCode << "):" << msg;
    throw RenderError(msg, outcome.exitCode, outcome.diagnostics);
}
