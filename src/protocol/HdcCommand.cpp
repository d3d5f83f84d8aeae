#include "HdcCommand.hpp"

namespace hdc {
namespace {
const vector<pair<HdcCommand, const char*>> COMMAND_NAMES = {
    {HdcCommand::KERNEL_HELP, "KERNEL_HELP"},
    {HdcCommand::KERNEL_HANDSHAKE, "KERNEL_HANDSHAKE"},
    {HdcCommand::KERNEL_CHANNEL_CLOSE, "KERNEL_CHANNEL_CLOSE"},
    {HdcCommand::KERNEL_TARGET_DISCOVER, "KERNEL_TARGET_DISCOVER"},
    {HdcCommand::KERNEL_TARGET_LIST, "KERNEL_TARGET_LIST"},
    {HdcCommand::KERNEL_TARGET_ANY, "KERNEL_TARGET_ANY"},
    {HdcCommand::KERNEL_TARGET_CONNECT, "KERNEL_TARGET_CONNECT"},
    {HdcCommand::KERNEL_TARGET_DISCONNECT, "KERNEL_TARGET_DISCONNECT"},
    {HdcCommand::KERNEL_ECHO, "KERNEL_ECHO"},
    {HdcCommand::KERNEL_ECHO_RAW, "KERNEL_ECHO_RAW"},
    {HdcCommand::KERNEL_ENABLE_KEEPALIVE, "KERNEL_ENABLE_KEEPALIVE"},
    {HdcCommand::KERNEL_WAKEUP_SLAVETASK, "KERNEL_WAKEUP_SLAVETASK"},
    {HdcCommand::CHECK_SERVER, "CHECK_SERVER"},
    {HdcCommand::CHECK_DEVICE, "CHECK_DEVICE"},
    {HdcCommand::WAIT_FOR, "WAIT_FOR"},
    {HdcCommand::SERVER_KILL, "SERVER_KILL"},
    {HdcCommand::SERVICE_START, "SERVICE_START"},
    {HdcCommand::UNITY_EXECUTE, "UNITY_EXECUTE"},
    {HdcCommand::UNITY_REMOUNT, "UNITY_REMOUNT"},
    {HdcCommand::UNITY_REBOOT, "UNITY_REBOOT"},
    {HdcCommand::UNITY_RUNMODE, "UNITY_RUNMODE"},
    {HdcCommand::UNITY_HILOG, "UNITY_HILOG"},
    {HdcCommand::UNITY_ROOTRUN, "UNITY_ROOTRUN"},
    {HdcCommand::JDWP_LIST, "JDWP_LIST"},
    {HdcCommand::JDWP_TRACK, "JDWP_TRACK"},
    {HdcCommand::SHELL_INIT, "SHELL_INIT"},
    {HdcCommand::SHELL_DATA, "SHELL_DATA"},
    {HdcCommand::FORWARD_INIT, "FORWARD_INIT"},
    {HdcCommand::FORWARD_CHECK, "FORWARD_CHECK"},
    {HdcCommand::FORWARD_CHECK_RESULT, "FORWARD_CHECK_RESULT"},
    {HdcCommand::FORWARD_ACTIVE_SLAVE, "FORWARD_ACTIVE_SLAVE"},
    {HdcCommand::FORWARD_ACTIVE_MASTER, "FORWARD_ACTIVE_MASTER"},
    {HdcCommand::FORWARD_DATA, "FORWARD_DATA"},
    {HdcCommand::FORWARD_FREE_CONTEXT, "FORWARD_FREE_CONTEXT"},
    {HdcCommand::FORWARD_LIST, "FORWARD_LIST"},
    {HdcCommand::FORWARD_REMOVE, "FORWARD_REMOVE"},
    {HdcCommand::FORWARD_SUCCESS, "FORWARD_SUCCESS"},
    {HdcCommand::FILE_INIT, "FILE_INIT"},
    {HdcCommand::FILE_CHECK, "FILE_CHECK"},
    {HdcCommand::FILE_BEGIN, "FILE_BEGIN"},
    {HdcCommand::FILE_DATA, "FILE_DATA"},
    {HdcCommand::FILE_FINISH, "FILE_FINISH"},
    {HdcCommand::APP_SIDELOAD, "APP_SIDELOAD"},
    {HdcCommand::FILE_MODE, "FILE_MODE"},
    {HdcCommand::DIR_MODE, "DIR_MODE"},
    {HdcCommand::APP_INIT, "APP_INIT"},
    {HdcCommand::APP_CHECK, "APP_CHECK"},
    {HdcCommand::APP_BEGIN, "APP_BEGIN"},
    {HdcCommand::APP_DATA, "APP_DATA"},
    {HdcCommand::APP_FINISH, "APP_FINISH"},
    {HdcCommand::APP_UNINSTALL, "APP_UNINSTALL"},
    {HdcCommand::HEARTBEAT_MSG, "HEARTBEAT_MSG"},
};

// Codes the server may put in front of a response payload
const set<uint16_t> RESPONSE_PREFIX_CODES = {
    0,    1,    2,    4,    5,    6,    7,    8,    9,    10,   13,
    14,   1001, 1002, 1003, 2000, 2001, 2505, 3000, 3001, 3002, 3003,
    3004, 3005, 3006, 3007, 3500, 3501, 3502, 3503, 3504,
};
}  // namespace

optional<HdcCommand> commandFromCode(uint16_t code) {
  for (const auto& it : COMMAND_NAMES) {
    if (commandToCode(it.first) == code) {
      return it.first;
    }
  }
  return std::nullopt;
}

const char* commandToString(HdcCommand command) {
  for (const auto& it : COMMAND_NAMES) {
    if (it.first == command) {
      return it.second;
    }
  }
  return "UNKNOWN";
}

bool hasResponsePrefix(uint16_t code) {
  return RESPONSE_PREFIX_CODES.find(code) != RESPONSE_PREFIX_CODES.end();
}

bool isResponse(HdcCommand command) {
  switch (command) {
    case HdcCommand::SHELL_DATA:
    case HdcCommand::FILE_DATA:
    case HdcCommand::FILE_FINISH:
    case HdcCommand::FORWARD_DATA:
    case HdcCommand::KERNEL_ECHO:
      return true;
    default:
      return false;
  }
}

string stripResponsePrefix(const string& payload) {
  if (payload.length() < RESPONSE_PREFIX_SIZE) {
    return payload;
  }
  uint16_t code = uint16_t(uint8_t(payload[0])) |
                  (uint16_t(uint8_t(payload[1])) << 8);
  if (!hasResponsePrefix(code)) {
    return payload;
  }
  VLOG(2) << "Stripping response prefix "
          << commandToString(static_cast<HdcCommand>(code)) << " (" << code
          << ")";
  return payload.substr(RESPONSE_PREFIX_SIZE);
}
}  // namespace hdc
