#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(datlanDiscovery)
Q_DECLARE_LOGGING_CATEGORY(datlanTransport)
Q_DECLARE_LOGGING_CATEGORY(datlanApp)

namespace datlan {

// Installs a Qt message handler that stamps every line with time, level and
// category. Lines always go to stderr; when `file_path` is non-empty they are
// also appended to that file.
void install_logging(const QString& file_path = QString{});

// Turns on debug output for the discovery and transport categories.
void enable_discovery_debug();

} // namespace datlan
