#ifndef __TB_CONTROL_SERVER__
#define __TB_CONTROL_SERVER__

#include "CommandRunner.hpp"
#include "Headers.hpp"
#include "SessionRegistry.hpp"

namespace tb {
/**
 * @brief HTTP surface to create, resize, list and terminate sessions and to
 * run one-shot commands.
 */
class ControlServer {
 public:
  ControlServer(shared_ptr<SessionRegistry> _registry,
                shared_ptr<CommandRunner> _commandRunner);

  /** @brief Binds and serves until stop(). Returns false if binding failed. */
  bool listen(const string& host, int port);
  /** @brief Binds an ephemeral port and returns it, or -1 on failure. */
  int bindToAnyPort(const string& host);
  /** @brief Serves on a socket bound by bindToAnyPort until stop(). */
  bool listenAfterBind();
  void stop();
  bool isRunning();

 protected:
  void installRoutes();
  void handleCreate(const httplib::Request& req, httplib::Response& res);
  void handleResize(const httplib::Request& req, httplib::Response& res);
  void handleTerminate(const httplib::Request& req, httplib::Response& res);
  void handleList(const httplib::Request& req, httplib::Response& res);
  void handleExecute(const httplib::Request& req, httplib::Response& res);

  shared_ptr<SessionRegistry> registry;
  shared_ptr<CommandRunner> commandRunner;
  httplib::Server server;
};
}  // namespace tb

#endif  // __TB_CONTROL_SERVER__
