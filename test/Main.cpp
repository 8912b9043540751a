#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace tb;

int main(int argc, char **argv) {
  srand(1);
  // Stream tests close sockets under active writers
  ::signal(SIGPIPE, SIG_IGN);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      tb::LogHandler::setupLogHandler(&argc, &argv);
  tb::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  tb::HandleTerminate();

  string logDirectoryPattern = GetTempDirectory() + string("tb_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  tb::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false,
                                false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  FATAL_FAIL(fs::remove_all(logDirectory.c_str()));
  return result;
}
