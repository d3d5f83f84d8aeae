#ifndef __HDC_COMMAND__
#define __HDC_COMMAND__

#include "Headers.hpp"

namespace hdc {
/**
 * @brief Command codes understood by the HDC server and daemon.
 */
enum class HdcCommand : uint16_t {
  // Kernel commands
  KERNEL_HELP = 0,
  KERNEL_HANDSHAKE = 1,
  KERNEL_CHANNEL_CLOSE = 2,
  KERNEL_TARGET_DISCOVER = 4,
  KERNEL_TARGET_LIST = 5,
  KERNEL_TARGET_ANY = 6,
  KERNEL_TARGET_CONNECT = 7,
  KERNEL_TARGET_DISCONNECT = 8,
  KERNEL_ECHO = 9,
  KERNEL_ECHO_RAW = 10,
  KERNEL_ENABLE_KEEPALIVE = 11,
  KERNEL_WAKEUP_SLAVETASK = 12,
  CHECK_SERVER = 13,
  CHECK_DEVICE = 14,
  WAIT_FOR = 15,
  SERVER_KILL = 16,
  SERVICE_START = 17,

  // Unity commands
  UNITY_EXECUTE = 1001,
  UNITY_REMOUNT = 1002,
  UNITY_REBOOT = 1003,
  UNITY_RUNMODE = 1004,
  UNITY_HILOG = 1005,
  UNITY_ROOTRUN = 1007,
  JDWP_LIST = 1008,
  JDWP_TRACK = 1009,

  // Shell
  SHELL_INIT = 2000,
  SHELL_DATA = 2001,

  // Port forwarding
  FORWARD_INIT = 2500,
  FORWARD_CHECK = 2501,
  FORWARD_CHECK_RESULT = 2502,
  FORWARD_ACTIVE_SLAVE = 2503,
  FORWARD_ACTIVE_MASTER = 2504,
  FORWARD_DATA = 2505,
  FORWARD_FREE_CONTEXT = 2506,
  FORWARD_LIST = 2507,
  FORWARD_REMOVE = 2508,
  FORWARD_SUCCESS = 2509,

  // File transfer
  FILE_INIT = 3000,
  FILE_CHECK = 3001,
  FILE_BEGIN = 3002,
  FILE_DATA = 3003,
  FILE_FINISH = 3004,
  APP_SIDELOAD = 3005,
  FILE_MODE = 3006,
  DIR_MODE = 3007,

  // App management
  APP_INIT = 3500,
  APP_CHECK = 3501,
  APP_BEGIN = 3502,
  APP_DATA = 3503,
  APP_FINISH = 3504,
  APP_UNINSTALL = 3506,

  HEARTBEAT_MSG = 5000,
};

/** @brief Size of the optional little-endian command prefix on responses. */
const size_t RESPONSE_PREFIX_SIZE = 2;

inline uint16_t commandToCode(HdcCommand command) {
  return static_cast<uint16_t>(command);
}

/**
 * @brief Maps a raw code onto the catalog.
 * @return std::nullopt for codes the catalog does not know.
 */
optional<HdcCommand> commandFromCode(uint16_t code);

/** @brief Returns the enumerator name, e.g. "SHELL_DATA". */
const char* commandToString(HdcCommand command);

/**
 * @brief True for the codes the server may put in front of a response
 * payload.
 */
bool hasResponsePrefix(uint16_t code);

/** @brief True for commands that carry a response to a previous request. */
bool isResponse(HdcCommand command);

/**
 * @brief Removes the 2-byte command prefix when its little-endian value is a
 * recognized prefix code, otherwise returns @p payload unchanged.
 */
string stripResponsePrefix(const string& payload);
}  // namespace hdc

#endif  // __HDC_COMMAND__
