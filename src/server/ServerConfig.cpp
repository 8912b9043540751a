#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace tb {
ServerConfig::ServerConfig()
    : controlPort(DEFAULT_CONTROL_PORT),
      streamPort(DEFAULT_STREAM_PORT),
      bindIp("0.0.0.0"),
      commandTimeout(DEFAULT_COMMAND_TIMEOUT),
      verbose(0),
      silent(false),
      // default max log file size is 20MB for tbserver
      maxLogSize("20971520"),
      logDirectory(GetTempDirectory()) {}

void ServerConfig::loadIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  controlPort = parsePositiveInt(ini.GetValue("Networking", "port", ""),
                                 controlPort);
  streamPort = parsePositiveInt(ini.GetValue("Networking", "stream_port", ""),
                                streamPort);
  const char* bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIpPtr) {
    bindIp = string(bindIpPtr);
  }

  const char* shellPtr = ini.GetValue("Session", "shell", NULL);
  if (shellPtr) {
    session.shell = string(shellPtr);
  }
  // zero is a valid scrollback size
  const char* scrollbackPtr = ini.GetValue("Session", "scrollback", NULL);
  if (scrollbackPtr && string(scrollbackPtr) == "0") {
    session.scrollbackLines = 0;
  } else {
    session.scrollbackLines =
        parsePositiveInt(scrollbackPtr ? scrollbackPtr : "",
                         session.scrollbackLines);
  }
  session.maxBufferBytes = parsePositiveInt(
      ini.GetValue("Session", "max_buffer_bytes", ""),
      int(session.maxBufferBytes));
  commandTimeout = parsePositiveInt(
      ini.GetValue("Session", "command_timeout", ""), commandTimeout);

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = atoi(vlevel);
  }
  const char* silentPtr = ini.GetValue("Debug", "silent", NULL);
  if (silentPtr && atoi(silentPtr) != 0) {
    silent = true;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxLogSize is a string of int value
    maxLogSize = to_string(atoi(logsize));
  }
  VLOG(1) << "Loaded config file " << filename;
}
}  // namespace tb
