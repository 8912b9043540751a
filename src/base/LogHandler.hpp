#ifndef __TB_LOG_HANDLER__
#define __TB_LOG_HANDLER__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Configures easylogging++ for the bridge server and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging with the bridge's line format.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file in `directory`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param maxLogSize Size in bytes after which the file is rolled out.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const string &directory, const string &prefix,
                            bool logToStdout, bool redirectStderrToFile,
                            const string &maxLogSize = "20971520");

  /** @brief Pre-rollout callback: drops the full log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Reconfigures the `stdout` logger to print bare messages. */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &directory,
                           const string &stderrFilename);

  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace tb
#endif  // __TB_LOG_HANDLER__
