#pragma once

namespace tasklex::util {

/**
 * @brief Install the "tasklex" logger as spdlog's default logger
 * @param verbosity 0 logs warnings and errors, 1 adds info, 2 and above adds debug
 * @param quiet Only errors reach the terminal
 *
 * Safe to call more than once; the last call wins.
 */
void initializeLogging(int verbosity, bool quiet = false);

}  // namespace tasklex::util
