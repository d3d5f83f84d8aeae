#ifndef __HDC_CLIENT_CONFIG__
#define __HDC_CLIENT_CONFIG__

#include "HdcException.hpp"
#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace hdc {
/**
 * @brief Endpoint, timeouts and logging options shared by sessions, the
 * device monitor and the command-line client.
 *
 * All timeouts are in milliseconds.
 */
struct ClientConfig {
  ClientConfig();

  string host;
  int port;

  // TCP connect and handshake read
  int64_t connectTimeoutMs;
  // Single-response commands
  int64_t commandTimeoutMs;
  int64_t shellTimeoutMs;
  // Per-frame timeouts for multi-frame commands
  int64_t installTimeoutMs;
  int64_t transferTimeoutMs;
  int64_t hilogTimeoutMs;
  // Per-chunk timeout while streaming logs
  int64_t streamTimeoutMs;
  // `wait` blocks until a device appears
  int64_t waitTimeoutMs;

  int64_t monitorIntervalMs;

  int verbose;
  string logDirectory;
  bool logToStdout;
  string maxLogSize;

  SocketEndpoint getEndpoint() const { return SocketEndpoint(host, port); }

  /**
   * @brief Overrides fields with the values present in an INI file.
   *
   * Sections: [Networking] host, port; [Timeouts] connect, command, shell,
   * install, transfer, hilog, stream, wait; [Monitor] interval;
   * [Debug] verbose, logsize, logtostdout, logdirectory.
   *
   * @throws HdcException (IO) when the file cannot be loaded and
   * (COMMAND_FAILED) when a value is not a whole number or fails validate().
   */
  void loadFromIni(const string& path);

  /**
   * @throws HdcException (COMMAND_FAILED) unless the port is in 1..65535,
   * every timeout and the monitor interval are positive and the verbose level
   * is not negative.
   */
  void validate() const;
};
}  // namespace hdc

#endif  // __HDC_CLIENT_CONFIG__
