#pragma once
#include <QString>
#include <QStringList>

#include "cancellation_registry.h"
#include "chunked_copier.h"

// Fast path through the platform bulk-copy utility (robocopy on Windows, cp
// elsewhere). Always recovered locally: callers fall back to ChunkedCopier on
// NativeToolUnavailable / NativeToolFailure.
//
// Cancellation is coarse. The tool cannot stop at a chunk boundary, so the
// token is polled every pollIntervalMs while the process runs; when it fires
// the process is killed, the partial destination removed and Cancelled is
// returned. Progress for the file is only known once the tool exits.
class NativeCopyStrategy {
public:
    enum class Flavor { Robocopy, Cp };

    explicit NativeCopyStrategy(const QString& toolPath = QString(), int threads = 32);

    void setPollInterval(int ms) { m_pollIntervalMs = ms; }

    // Empty when no tool could be resolved
    QString resolvedTool() const { return m_program; }
    bool isAvailable() const { return !m_program.isEmpty(); }
    Flavor flavor() const { return m_flavor; }

    // Argument list for one file; empty when this flavor cannot express the
    // transfer (robocopy cannot rename while copying)
    QStringList buildArguments(const QString& src, const QString& dst) const;

    CopyResult tryNativeCopy(const QString& src, const QString& dst, const CancellationToken& cancel) const;

    static QString defaultToolName();

private:
    bool isSuccessExitCode(int code) const;

    QString m_program;
    Flavor m_flavor = Flavor::Cp;
    int m_threads = 32;
    int m_pollIntervalMs = 50;
};
