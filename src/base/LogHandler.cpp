#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tabby {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts/ini, not from easylogging's own --v flags.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool redirectStderrToFile,
                               bool appendPid, string maxlogsize) {
  string stem = logFileStem(appendPid);
  string logPath = createLogFile(path, filenamePrefix + "-" + stem + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path, filenamePrefix + "-stderr-" + stem + ".log");
  }
}

string LogHandler::logFileStem(bool appendPid) {
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local);
  string stem(stamp);
  if (appendPid) {
    stem += "_" + to_string(getpid());
  }
  return stem;
}

void LogHandler::apply(const el::Configurations &defaultConf,
                       const string &threadName) {
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName(threadName);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
}

void LogHandler::setVerbosity(int level) {
  el::Loggers::setVerboseLevel(level);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t) {
  // The log file is closed while this runs; logging here would recurse.
  // One previous generation is kept next to the live file.
  string previous = string(filename) + ".1";
  if (::rename(filename, previous.c_str()) == -1) {
    ::remove(filename);
  }
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::defaultLogDirectory() {
  return GetTempDirectory() + "tabby";
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << ec.message() << endl;
    exit(1);
  }
  string logPath = path + "/" + filename;
  // Log files may hold window titles and pane contents
  int fd = ::open(logPath.c_str(), O_NOFOLLOW | O_CREAT | O_WRONLY, 0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return logPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string stderrPath = createLogFile(path, stderrFilename);
  FILE *redirected = freopen(stderrPath.c_str(), "w", stderr);
  if (!redirected) {
    STFATAL << "Could not redirect stderr to " << stderrPath;
  }
  setvbuf(redirected, NULL, _IOLBF, BUFSIZ);
}
}  // namespace tabby
