#pragma once

#include "core/result.hpp"

#include <QString>

namespace spool::logging {

/**
 * Route Qt log output to `path`, one line per message:
 * "<iso-utc-ts> <D|I|W|C|F> <category> <message>".
 * Output also keeps going to stderr.
 */
[[nodiscard]] Result<void, Error> install_file_logging(const QString& path);

/**
 * Restore the default Qt handler and close the file.
 */
void uninstall_file_logging();

/**
 * <app data dir>/logs/spool.log, or empty when there is no writable
 * data location.
 */
[[nodiscard]] QString default_log_file_path();

} // namespace spool::logging
