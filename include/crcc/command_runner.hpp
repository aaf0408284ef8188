#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

#include "crcc/cancellation.hpp"

namespace crcc {

struct CommandResult {
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    bool started = true;
    bool timedOut = false;
    bool cancelled = false;

    [[nodiscard]] bool success() const { return started && !timedOut && !cancelled && exitCode == 0; }
};

class CommandRunner {
public:
    // timeoutMs <= 0 waits until the process exits or the token is cancelled.
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 15000,
        const CancellationToken& cancel = CancellationToken(),
        const QMap<QString, QString>& extraEnv = {});
};

}  // namespace crcc
