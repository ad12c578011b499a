#pragma once

#include <QLoggingCategory>
#include <QString>

namespace tuid {

Q_DECLARE_LOGGING_CATEGORY(lcId)
Q_DECLARE_LOGGING_CATEGORY(lcUuid)
Q_DECLARE_LOGGING_CATEGORY(lcCrypto)
Q_DECLARE_LOGGING_CATEGORY(lcSerde)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

// Installs a Qt message handler that appends every message to `path`.
// Warnings and above are also passed on to the handler it replaces.
// Returns false if the file cannot be opened; any log file installed by an
// earlier call is then closed and the handler it replaced is restored.
bool install_file_logging(const QString& path);

// Restores the handler that was active before and closes the log file.
// Does nothing to a handler installed by someone else since.
void uninstall_file_logging();

// Turns the debug level of every tuid.* category on or off.
void set_debug_logging(bool enabled);

} // namespace tuid
