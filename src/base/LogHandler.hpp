#ifndef __TABBY_LOG_HANDLER__
#define __TABBY_LOG_HANDLER__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Configures easylogging++ for the daemon, the renderers and the tests.
 *
 * The renderer owns the terminal it draws on, so nothing but the "stdout"
 * logger may ever write to the console from that process.  Everything else
 * goes to a log file in the runtime directory.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param path Directory receiving the log files.
   * @param filenamePrefix Prefix such as `tabby-daemon-default`.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies the configuration to the default logger, names the calling
   * thread and installs the rollout callback.
   */
  static void apply(const el::Configurations &defaultConf,
                    const string &threadName);

  /** @brief Sets the VLOG level from the command line or the config file. */
  static void setVerbosity(int level);

  /**
   * @brief Rotates a full log file to `<name>.1`, replacing the previous one.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /** @brief Directory used for log files unless overridden. */
  static string defaultLogDirectory();

 private:
  /** @brief `YYYY-mm-dd_HH-MM-SS`, optionally suffixed with `_<pid>`. */
  static string logFileStem(bool appendPid);

  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tabby
#endif  // __TABBY_LOG_HANDLER__
