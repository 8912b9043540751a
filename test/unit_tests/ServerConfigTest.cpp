#include "ServerConfig.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
string writeTempConfig(const string& contents) {
  string pattern = GetTempDirectory() + string("tb_config_XXXXXX");
  int fd = mkstemp(&pattern[0]);
  FATAL_FAIL(fd);
  FILE* file = fdopen(fd, "w");
  fputs(contents.c_str(), file);
  fclose(file);
  return pattern;
}
}  // namespace

TEST_CASE("Defaults without a config file", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE(config.controlPort == 8767);
  REQUIRE(config.streamPort == 8768);
  REQUIRE(config.bindIp == "0.0.0.0");
  REQUIRE(config.session.shell.empty());
  REQUIRE(config.session.scrollbackLines == DEFAULT_SCROLLBACK_LINES);
  REQUIRE(config.session.maxBufferBytes == DEFAULT_MAX_BUFFER_BYTES);
  REQUIRE(config.commandTimeout == 30);
  REQUIRE(config.verbose == 0);
  REQUIRE(!config.silent);
  REQUIRE(config.maxLogSize == "20971520");
}

TEST_CASE("Values are read from every section", "[ServerConfig]") {
  string filename = writeTempConfig(
      "[Networking]\n"
      "port = 9000\n"
      "stream_port = 9001\n"
      "bind_ip = 127.0.0.1\n"
      "\n"
      "[Session]\n"
      "shell = /bin/zsh\n"
      "scrollback = 0\n"
      "max_buffer_bytes = 4096\n"
      "command_timeout = 5\n"
      "\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1024\n");
  ServerConfig config;
  config.loadIniFile(filename);
  ::unlink(filename.c_str());

  REQUIRE(config.controlPort == 9000);
  REQUIRE(config.streamPort == 9001);
  REQUIRE(config.bindIp == "127.0.0.1");
  REQUIRE(config.session.shell == "/bin/zsh");
  REQUIRE(config.session.scrollbackLines == 0);
  REQUIRE(config.session.maxBufferBytes == 4096);
  REQUIRE(config.commandTimeout == 5);
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1024");
}

TEST_CASE("Missing and invalid values keep the defaults", "[ServerConfig]") {
  string filename = writeTempConfig(
      "[Networking]\n"
      "port = not-a-port\n"
      "[Session]\n"
      "command_timeout = -4\n");
  ServerConfig config;
  config.loadIniFile(filename);
  ::unlink(filename.c_str());

  REQUIRE(config.controlPort == DEFAULT_CONTROL_PORT);
  REQUIRE(config.streamPort == DEFAULT_STREAM_PORT);
  REQUIRE(config.commandTimeout == DEFAULT_COMMAND_TIMEOUT);
}

TEST_CASE("An unreadable config file is an error", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE_THROWS_AS(config.loadIniFile("/nonexistent/tbserver.ini"),
                    std::runtime_error);
}
