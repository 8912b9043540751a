#include <cxxopts.hpp>

#include "CommandRunner.hpp"
#include "ControlServer.hpp"
#include "LogHandler.hpp"
#include "PtyProcessHandle.hpp"
#include "ServerConfig.hpp"
#include "SessionRegistry.hpp"
#include "SignalPipe.hpp"
#include "StreamServer.hpp"
#include "TcpSocketHandler.hpp"

using namespace tb;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tb::HandleTerminate();

  // Override easylogging handler for sigint.  The servers are stopped from
  // a regular thread so the normal teardown runs.
  SignalPipe shutdownSignals;
  shutdownSignals.install(SIGINT);
  shutdownSignals.install(SIGTERM);
  // Dead stream and http peers are reported through write errors
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tbserver",
                           "Persistent terminal sessions over HTTP and TCP");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "HTTP control port",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_CONTROL_PORT)))  //
        ("streamport", "TCP stream port",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_STREAM_PORT)))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value("0.0.0.0"))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(GetTempDirectory()))  //
        ("shell", "Shell to run in new terminals",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tbserver version " << TB_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    if (result.count("cfgfile")) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        config.loadIniFile(cfgfilename);
      } catch (const std::runtime_error &re) {
        STFATAL << re.what();
      }
    }

    // Command line options win over the config file
    if (result.count("port")) {
      config.controlPort = result["port"].as<int>();
    }
    if (result.count("streamport")) {
      config.streamPort = result["streamport"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("shell")) {
      config.session.shell = result["shell"].as<string>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "tbserver",
                              logToStdout, !logToStdout, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("tbserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<ProcessSpawner> spawner(new PtyProcessSpawner());
    shared_ptr<SessionRegistry> registry(
        new SessionRegistry(spawner, config.session));
    shared_ptr<CommandRunner> commandRunner(
        new CommandRunner(spawner, config.commandTimeout));

    shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    SocketEndpoint streamEndpoint;
    streamEndpoint.set_port(config.streamPort);
    if (config.bindIp.length() && config.bindIp != "0.0.0.0") {
      streamEndpoint.set_name(config.bindIp);
    }
    shared_ptr<StreamServer> streamServer;
    try {
      streamServer.reset(
          new StreamServer(tcpSocketHandler, streamEndpoint, registry));
    } catch (const std::runtime_error &re) {
      STFATAL << "Could not start stream server: " << re.what();
    }
    thread streamThread([streamServer]() {
      el::Helpers::setThreadName("stream-server");
      streamServer->run();
    });

    CLOG(INFO, "stdout") << "TermBridge listening on http://" << config.bindIp
                         << ":" << config.controlPort << " (streams on port "
                         << config.streamPort << ")" << endl;
    ControlServer controlServer(registry, commandRunner);
    atomic<bool> controlServerDone(false);
    thread shutdownThread([&controlServer, &controlServerDone,
                           &shutdownSignals]() {
      el::Helpers::setThreadName("shutdown");
      int signum = shutdownSignals.wait();
      if (signum != 0) {
        STERROR << "Got signal " << signum;
        CLOG(INFO, "stdout") << endl
                             << "Got interrupt (perhaps ctrl+c?).  Shutting "
                                "down."
                             << endl;
      }
      // stop() is a no-op until the server is accepting
      while (!controlServerDone) {
        if (controlServer.isRunning()) {
          controlServer.stop();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    bool listened = controlServer.listen(config.bindIp, config.controlPort);
    controlServerDone = true;
    shutdownSignals.wake();
    shutdownThread.join();
    if (!listened) {
      STFATAL << "Could not listen on " << config.bindIp << ":"
              << config.controlPort;
    }

    streamServer->shutdown();
    streamThread.join();
    registry->terminateAll();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
