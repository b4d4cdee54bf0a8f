#pragma once

#include <QString>
#include <QStringList>

namespace mountfetch {

struct CommandResult {
    // False when the program could not be launched, crashed or timed out.
    bool completed = false;
    int exitCode = -1;
    QString output;
    QString error;
};

// Run a program to completion and capture its standard output.
// A program still running after timeoutMs is killed.
CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs);

} // namespace mountfetch
