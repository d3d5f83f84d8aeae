#include "ClientConfig.hpp"

#include "SimpleIni.h"

namespace hdc {
namespace {
int64_t readInteger(const CSimpleIniA& ini, const char* section,
                    const char* key, int64_t defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  string valueString(value);
  int64_t retval = 0;
  size_t used = 0;
  try {
    retval = stoll(valueString, &used);
  } catch (const std::logic_error&) {
    used = 0;
  }
  // Reject trailing characters such as "12abc"
  if (used == 0 || used != valueString.length()) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       string("Invalid value for ") + section + "." + key +
                           ": " + valueString);
  }
  return retval;
}

void requireAtLeast(const char* name, int64_t value, int64_t minimum) {
  if (value < minimum) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       string("Invalid ") + name + ": " + to_string(value) +
                           " (must be at least " + to_string(minimum) + ")");
  }
}
}  // namespace

ClientConfig::ClientConfig()
    : host(HDC_DEFAULT_HOST),
      port(HDC_DEFAULT_PORT),
      connectTimeoutMs(10000),
      commandTimeoutMs(10000),
      shellTimeoutMs(5000),
      installTimeoutMs(30000),
      transferTimeoutMs(60000),
      hilogTimeoutMs(5000),
      streamTimeoutMs(30000),
      waitTimeoutMs(600000),
      monitorIntervalMs(2000),
      verbose(0),
      logDirectory(GetTempDirectory()),
      logToStdout(false),
      maxLogSize("20971520") {}

void ClientConfig::loadFromIni(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw HdcException(HdcErrorKind::IO,
                       "Unable to load config file: " + path);
  }
  VLOG(1) << "Loading config from " << path;

  const char* hostString = ini.GetValue("Networking", "host", NULL);
  if (hostString) {
    host = string(hostString);
  }
  port = int(readInteger(ini, "Networking", "port", port));

  connectTimeoutMs = readInteger(ini, "Timeouts", "connect", connectTimeoutMs);
  commandTimeoutMs = readInteger(ini, "Timeouts", "command", commandTimeoutMs);
  shellTimeoutMs = readInteger(ini, "Timeouts", "shell", shellTimeoutMs);
  installTimeoutMs = readInteger(ini, "Timeouts", "install", installTimeoutMs);
  transferTimeoutMs =
      readInteger(ini, "Timeouts", "transfer", transferTimeoutMs);
  hilogTimeoutMs = readInteger(ini, "Timeouts", "hilog", hilogTimeoutMs);
  streamTimeoutMs = readInteger(ini, "Timeouts", "stream", streamTimeoutMs);
  waitTimeoutMs = readInteger(ini, "Timeouts", "wait", waitTimeoutMs);

  monitorIntervalMs =
      readInteger(ini, "Monitor", "interval", monitorIntervalMs);

  verbose = int(readInteger(ini, "Debug", "verbose", verbose));
  logToStdout = readInteger(ini, "Debug", "logtostdout", logToStdout) != 0;
  const char* logSize = ini.GetValue("Debug", "logsize", NULL);
  if (logSize) {
    maxLogSize = string(logSize);
  }
  const char* logDir = ini.GetValue("Debug", "logdirectory", NULL);
  if (logDir) {
    logDirectory = string(logDir);
  }
  validate();
}

void ClientConfig::validate() const {
  if (port <= 0 || port > 65535) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       "Invalid port: " + to_string(port));
  }
  requireAtLeast("connect timeout", connectTimeoutMs, 1);
  requireAtLeast("command timeout", commandTimeoutMs, 1);
  requireAtLeast("shell timeout", shellTimeoutMs, 1);
  requireAtLeast("install timeout", installTimeoutMs, 1);
  requireAtLeast("transfer timeout", transferTimeoutMs, 1);
  requireAtLeast("hilog timeout", hilogTimeoutMs, 1);
  requireAtLeast("stream timeout", streamTimeoutMs, 1);
  requireAtLeast("wait timeout", waitTimeoutMs, 1);
  requireAtLeast("monitor interval", monitorIntervalMs, 1);
  requireAtLeast("verbose level", verbose, 0);
}
}  // namespace hdc
