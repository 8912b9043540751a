#include "ControlServer.hpp"

#include "BridgeErrors.hpp"
#include "JsonLib.hpp"

namespace tb {
namespace {
string dumpJson(const json& j) {
  // Command output is not guaranteed to be valid UTF-8
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

int64_t sessionIdFromPath(const httplib::Request& req) {
  return std::stoll(req.matches[1].str());
}
}  // namespace

ControlServer::ControlServer(shared_ptr<SessionRegistry> _registry,
                             shared_ptr<CommandRunner> _commandRunner)
    : registry(_registry), commandRunner(_commandRunner) {
  installRoutes();
}

void ControlServer::installRoutes() {
  server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});

  server.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_content(string("TermBridge ") + TB_VERSION + "\n", "text/plain");
  });
  server.Options(".*", [](const httplib::Request&, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
  });
  server.Post("/terminals",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleCreate(req, res);
              });
  server.Get("/terminals",
             [this](const httplib::Request& req, httplib::Response& res) {
               handleList(req, res);
             });
  server.Post(R"(/terminals/(\d+)/size)",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleResize(req, res);
              });
  server.Post(R"(/terminals/(\d+)/terminate)",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleTerminate(req, res);
              });
  server.Post("/execute-command",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleExecute(req, res);
              });
}

void ControlServer::handleCreate(const httplib::Request& req,
                                 httplib::Response& res) {
  int columns = parsePositiveInt(req.get_param_value("cols"), DEFAULT_COLUMNS);
  int rows = parsePositiveInt(req.get_param_value("rows"), DEFAULT_ROWS);
  try {
    int64_t sessionId = registry->create(columns, rows);
    res.set_content(to_string(sessionId), "text/plain");
  } catch (const SpawnError& se) {
    LOG(ERROR) << "Could not create terminal: " << se.what();
    res.status = 500;
    res.set_content(se.what(), "text/plain");
  }
}

void ControlServer::handleResize(const httplib::Request& req,
                                 httplib::Response& res) {
  int columns = parsePositiveInt(req.get_param_value("cols"), -1);
  int rows = parsePositiveInt(req.get_param_value("rows"), -1);
  if (columns < 0 || rows < 0) {
    res.status = 400;
    res.set_content("cols and rows must be positive integers", "text/plain");
    return;
  }
  try {
    registry->resize(sessionIdFromPath(req), columns, rows);
  } catch (const SessionGone& sg) {
    res.status = 404;
    res.set_content(sg.what(), "text/plain");
  } catch (const std::out_of_range&) {
    res.status = 404;
    res.set_content("Unknown terminal", "text/plain");
  }
}

void ControlServer::handleTerminate(const httplib::Request& req,
                                    httplib::Response& res) {
  try {
    registry->terminate(sessionIdFromPath(req));
  } catch (const SessionGone& sg) {
    res.status = 404;
    res.set_content(sg.what(), "text/plain");
  } catch (const std::out_of_range&) {
    res.status = 404;
    res.set_content("Unknown terminal", "text/plain");
  }
}

void ControlServer::handleList(const httplib::Request&,
                               httplib::Response& res) {
  json terminals = json::array();
  for (int64_t sessionId : registry->ids()) {
    shared_ptr<Session> session;
    try {
      session = registry->get(sessionId);
    } catch (const SessionGone&) {
      // Exited while listing
      continue;
    }
    json terminal;
    terminal["id"] = sessionId;
    terminal["columns"] = session->getColumns();
    terminal["rows"] = session->getRows();
    terminal["state"] = sessionStateName(session->getState());
    terminals.push_back(terminal);
  }
  res.set_content(dumpJson(terminals), "application/json");
}

void ControlServer::handleExecute(const httplib::Request& req,
                                  httplib::Response& res) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("command") ||
      !body["command"].is_string() ||
      body["command"].get<string>().empty()) {
    json error;
    error["error"] = "Command is required.";
    res.status = 400;
    res.set_content(dumpJson(error), "application/json");
    return;
  }
  string command = body["command"].get<string>();
  try {
    json result;
    result["output"] = commandRunner->execute(command);
    res.set_content(dumpJson(result), "application/json");
  } catch (const SpawnError& se) {
    LOG(ERROR) << "Could not run command: " << se.what();
    json error;
    error["error"] = se.what();
    res.status = 500;
    res.set_content(dumpJson(error), "application/json");
  }
}

bool ControlServer::listen(const string& host, int port) {
  LOG(INFO) << "Control server listening on " << host << ":" << port;
  return server.listen(host.c_str(), port);
}

int ControlServer::bindToAnyPort(const string& host) {
  return server.bind_to_any_port(host.c_str());
}

bool ControlServer::listenAfterBind() { return server.listen_after_bind(); }

void ControlServer::stop() { server.stop(); }

bool ControlServer::isRunning() { return server.is_running(); }
}  // namespace tb
