#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tb {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity is set explicitly from cxxopts/ini, see TermBridgeServerMain
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
                               const string &directory, const string &prefix,
                               bool logToStdout, bool redirectStderrToFile,
                               const string &maxLogSize) {
  char timeBuffer[80];
  time_t rawtime = time(NULL);
  strftime(timeBuffer, sizeof(timeBuffer), "%Y-%m-%d_%H-%M-%S",
           localtime(&rawtime));
  string suffix = string(timeBuffer) + "_" + std::to_string(getpid()) + ".log";

  string logFilename = createLogFile(directory, prefix + "-" + suffix);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFilename);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(directory, prefix + "-stderr-" + suffix);
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  remove(filename);
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

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

void LogHandler::stderrToFile(const string &directory,
                              const string &stderrFilename) {
  string fullFname = createLogFile(directory, stderrFilename);
  FILE *stderrStream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Invalid filename " << fullFname;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);  // set to line buffering
}
}  // namespace tb
