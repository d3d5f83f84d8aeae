#ifndef __HDC_LOG_HANDLER__
#define __HDC_LOG_HANDLER__

#include "HdcException.hpp"
#include "Headers.hpp"

namespace hdc {
/**
 * @brief Configures easylogging++ for the client and its tests.
 *
 * Diagnostics go to the default logger (a per-process log file), while
 * command output goes to the "stdout" logger.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging++ from `argc/argv`.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points @p defaultConf at a new log file inside @p directory named
   * `<prefix>-<timestamp>_<pid>.log`.
   * @throws HdcException (IO) when the directory or file cannot be created.
   * @return Full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory, const string &prefix,
                              bool logToStdout = false,
                              const string &maxLogSize = "20971520");

  /** @brief Deletes a log file that easylogging++ has rolled over. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Makes the "stdout" logger print bare messages. */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace hdc
#endif  // __HDC_LOG_HANDLER__
