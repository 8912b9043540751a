#ifndef __TB_SERVER_CONFIG__
#define __TB_SERVER_CONFIG__

#include "Headers.hpp"
#include "SessionRegistry.hpp"

namespace tb {
/**
 * @brief Settings of a tbserver process. Starts from the built-in defaults,
 * then the ini file, then the command line.
 */
class ServerConfig {
 public:
  ServerConfig();

  /**
   * @brief Overlays the values present in an ini file.
   * @throws std::runtime_error if the file cannot be read or parsed.
   */
  void loadIniFile(const string& filename);

  int controlPort;
  int streamPort;
  /** @brief Empty binds every interface. */
  string bindIp;
  SessionSettings session;
  int commandTimeout;

  int verbose;
  bool silent;
  string maxLogSize;
  string logDirectory;
};
}  // namespace tb

#endif  // __TB_SERVER_CONFIG__
