#include "HdcSession.hpp"

#include "DeviceMonitor.hpp"
#include "HdcCommand.hpp"
#include "TextUtils.hpp"

namespace hdc {
namespace {
const string EMPTY_TARGET_LIST = "[Empty]";
const string FAIL_PREFIX = "[Fail]";

const vector<string> INSTALL_MARKERS = {"Success", "success", "Fail", "fail"};
const vector<string> TRANSFER_MARKERS = {"FileTransfer finish",
                                         "Transfer finish", "[Fail]", "fail"};

bool containsAnyMarker(const string& text, const vector<string>& markers) {
  for (const auto& marker : markers) {
    if (text.find(marker) != string::npos) {
      return true;
    }
  }
  return false;
}

vector<string> nonEmptyTrimmedLines(const string& text) {
  vector<string> lines;
  for (const auto& line : split(text, '\n')) {
    string trimmed = trim(line);
    if (!trimmed.empty()) {
      lines.push_back(trimmed);
    }
  }
  return lines;
}

string buildCommand(const string& verb, const string& flags,
                    const vector<string>& args) {
  vector<string> parts = {verb};
  if (!flags.empty()) {
    parts.push_back(flags);
  }
  parts.insert(parts.end(), args.begin(), args.end());
  return joinStrings(parts, " ");
}

string buildHilogCommand(const string& args) {
  return args.empty() ? string("hilog") : "hilog " + args;
}
}  // namespace

HdcSession::HdcSession(shared_ptr<SocketHandler> _socketHandler,
                       const SocketEndpoint& _endpoint,
                       const ClientConfig& _config)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      config(_config),
      socketFd(-1),
      handshakeComplete(false),
      channelId(0) {}

HdcSession::HdcSession(shared_ptr<SocketHandler> _socketHandler,
                       const ClientConfig& _config)
    : HdcSession(_socketHandler, _config.getEndpoint(), _config) {}

HdcSession::~HdcSession() { close(); }

void HdcSession::connect() {
  LOG(INFO) << "Connecting to HDC server at " << endpoint;
  openConnection();
  handshake(std::nullopt);
  selectedDevice.reset();
}

void HdcSession::connectDevice(const string& connectKey) {
  if (connectKey.empty()) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       "Device connect key must not be empty");
  }
  LOG(INFO) << "Connecting to device: " << connectKey;
  openConnection();
  handshake(connectKey);
}

void HdcSession::close() {
  handshakeComplete = false;
  if (socketFd >= 0) {
    VLOG(1) << "Closing session on fd " << socketFd;
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}

void HdcSession::openConnection() {
  close();
  int fd = socketHandler->connect(endpoint, config.connectTimeoutMs);
  if (fd < 0) {
    throw HdcException(HdcErrorKind::IO, "Unable to connect to HDC server at " +
                                             endpoint.getName() + ":" +
                                             to_string(endpoint.getPort()));
  }
  socketFd = fd;
}

void HdcSession::handshake(const optional<string>& connectKey) {
  VLOG(1) << "Starting channel handshake";
  string data = socketHandler->readPacket(socketFd, config.connectTimeoutMs);
  ChannelHandshake received = ChannelHandshake::parse(data);
  received.verifyBanner();
  channelId = received.getChannelId();
  serverHandshake = received;
  VLOG(1) << "Assigned channel id: " << channelId
          << ", stable buffer: " << received.isStableBuffer()
          << ", server version: " << received.getVersion();

  ChannelHandshake reply = received;
  reply.setConnectKey(connectKey ? *connectKey : string());
  socketHandler->writePacket(socketFd, reply.serializeAsReceived(),
                             config.connectTimeoutMs);

  handshakeComplete = true;
  if (connectKey) {
    selectedDevice = *connectKey;
  }
  LOG(INFO) << "Channel handshake complete (channel " << channelId
            << (connectKey ? ", device " + *connectKey : string()) << ")";
}

void HdcSession::reconnectSelectedDevice() {
  if (!selectedDevice) {
    return;
  }
  string device = *selectedDevice;
  VLOG(1) << "Reconnecting to device after shell command: " << device;
  try {
    connectDevice(device);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Failed to reconnect to " << device
                 << " after shell: " << ex.what();
  }
}

void HdcSession::requireConnected() const {
  if (!isConnected()) {
    throw HdcException(HdcErrorKind::NOT_CONNECTED,
                       "Not connected to the HDC server");
  }
}

void HdcSession::sendCommand(const string& command) {
  requireConnected();
  VLOG(1) << "Sending command: " << command;
  socketHandler->writePacket(socketFd, command, config.commandTimeoutMs);
}

string HdcSession::readResponse(int64_t timeoutMs) {
  try {
    return socketHandler->readPacket(socketFd, timeoutMs);
  } catch (const HdcException& ex) {
    // A late or partial frame would be read as the next command's reply
    LOG(WARNING) << "Dropping connection after failed read ("
                 << errorKindToString(ex.getKind()) << "): " << ex.what();
    close();
    throw;
  }
}

string HdcSession::executeSingle(const string& command, int64_t timeoutMs) {
  sendCommand(command);
  string response = responseToText(readResponse(timeoutMs));
  VLOG(1) << "Response to '" << command << "': " << response;
  return response;
}

string HdcSession::executeMultiFrame(const string& command, int64_t timeoutMs,
                                     const vector<string>& markers) {
  ResponseStream stream = openStream(command, timeoutMs);
  string output;
  string chunk;
  while (nextStreamChunk(&stream, &chunk)) {
    output.append(chunk);
    if (containsAnyMarker(output, markers)) {
      VLOG(1) << "Completion marker seen for '" << command << "'";
      break;
    }
  }
  if (stream.timedOut()) {
    // The timeout may have cut a frame in half
    close();
    if (output.empty()) {
      LOG(WARNING) << "Timed out waiting for a response to '" << command
                   << "'";
      throw HdcException(HdcErrorKind::TIMEOUT,
                         "Timed out waiting for a response to '" + command +
                             "'");
    }
    VLOG(1) << "No more data for '" << command << "', returning "
            << output.length() << " bytes";
  }
  return output;
}

string HdcSession::executeOnFreshSession(const string& command) {
  HdcSession freshSession(socketHandler, endpoint, config);
  freshSession.connect();
  string response = freshSession.executeSingle(command, config.commandTimeoutMs);
  if (startsWith(response, FAIL_PREFIX)) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED, response);
  }
  return response;
}

bool HdcSession::nextStreamChunk(ResponseStream* stream, string* chunk) {
  try {
    return stream->next(chunk);
  } catch (const HdcException& ex) {
    if (ex.getKind() != HdcErrorKind::TEXT_DECODE) {
      close();
    }
    throw;
  }
}

ResponseStream HdcSession::openStream(const string& command,
                                      int64_t timeoutMs) {
  sendCommand(command);
  return ResponseStream(socketHandler, socketFd, timeoutMs);
}

vector<string> HdcSession::listTargets() {
  string response = executeSingle("list targets", config.commandTimeoutMs);
  vector<string> devices;
  for (const auto& line : nonEmptyTrimmedLines(response)) {
    if (line != EMPTY_TARGET_LIST) {
      devices.push_back(line);
    }
  }
  VLOG(1) << "Found " << devices.size() << " device(s)";
  return devices;
}

string HdcSession::checkServer() {
  return executeSingle("checkserver", config.commandTimeoutMs);
}

string HdcSession::waitForDevice() {
  LOG(INFO) << "Waiting for device";
  string response = executeSingle("wait", config.waitTimeoutMs);
  // "Wait for connected target is <device>"
  const string marker = "is ";
  auto start = response.find(marker);
  if (start == string::npos) {
    return trim(response);
  }
  start += marker.length();
  auto end = response.find(marker, start);
  return trim(response.substr(
      start, end == string::npos ? string::npos : end - start));
}

string HdcSession::shell(const string& command) {
  sendCommand("shell " + command);
  string payload = readResponse(config.shellTimeoutMs);
  string output = decodeUtf8Lossy(stripResponsePrefix(payload));
  VLOG(1) << "Shell response: " << payload.length() << " bytes";

  // The server closes the channel after a shell command
  reconnectSelectedDevice();
  return output;
}

string HdcSession::targetCommand(const string& connectKey,
                                 const string& command) {
  connectDevice(connectKey);
  return executeSingle(command, config.commandTimeoutMs);
}

string HdcSession::shellOnDevice(const string& connectKey,
                                 const string& command) {
  connectDevice(connectKey);
  return shell(command);
}

string HdcSession::fport(const ForwardNode& local, const ForwardNode& remote) {
  return createForward(ForwardTask::forward(local, remote));
}

string HdcSession::rport(const ForwardNode& remote, const ForwardNode& local) {
  return createForward(ForwardTask::reverse(remote, local));
}

string HdcSession::createForward(const ForwardTask& task) {
  LOG(INFO) << "Creating " << (task.isForward() ? "forward" : "reverse")
            << ": " << task.taskString();
  return executeSingle(task.toCommandString(), config.commandTimeoutMs);
}

vector<string> HdcSession::fportList() {
  return nonEmptyTrimmedLines(executeOnFreshSession("fport ls"));
}

string HdcSession::fportRemove(const string& taskString) {
  if (trim(taskString).empty()) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       "Forward task to remove must not be empty");
  }
  LOG(INFO) << "Removing forward: " << taskString;
  return executeOnFreshSession("fport rm " + taskString);
}

string HdcSession::install(const vector<string>& paths,
                           const InstallOptions& options) {
  if (paths.empty()) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       "No package paths given to install");
  }
  for (const auto& path : paths) {
    if (!isValidTransferPath(path)) {
      throw HdcException(HdcErrorKind::COMMAND_FAILED,
                         "Invalid package path: '" + path + "'");
    }
  }
  LOG(INFO) << "Installing " << joinStrings(paths, " ");
  return executeMultiFrame(buildCommand("install", options.toFlags(), paths),
                           config.installTimeoutMs, INSTALL_MARKERS);
}

string HdcSession::uninstall(const string& package,
                             const UninstallOptions& options) {
  if (trim(package).empty()) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       "Package name must not be empty");
  }
  LOG(INFO) << "Uninstalling " << package;
  return executeSingle(buildCommand("uninstall", options.toFlags(), {package}),
                       config.commandTimeoutMs);
}

string HdcSession::fileSend(const string& localPath, const string& remotePath,
                            const FileTransferOptions& options) {
  if (!isValidTransferPath(localPath) || !isValidTransferPath(remotePath)) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED, "Invalid file path");
  }
  LOG(INFO) << "Sending file " << localPath << " -> " << remotePath;
  return executeMultiFrame(
      buildCommand("file send", options.toFlags(), {localPath, remotePath}),
      config.transferTimeoutMs, TRANSFER_MARKERS);
}

string HdcSession::fileRecv(const string& remotePath, const string& localPath,
                            const FileTransferOptions& options) {
  if (!isValidTransferPath(localPath) || !isValidTransferPath(remotePath)) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED, "Invalid file path");
  }
  LOG(INFO) << "Receiving file " << remotePath << " -> " << localPath;
  return executeMultiFrame(
      buildCommand("file recv", options.toFlags(), {remotePath, localPath}),
      config.transferTimeoutMs, TRANSFER_MARKERS);
}

string HdcSession::hilog(const string& args) {
  return executeMultiFrame(buildHilogCommand(args), config.hilogTimeoutMs, {});
}

void HdcSession::hilogStream(const string& args, ChunkCallback callback) {
  LOG(INFO) << "Starting hilog stream";
  ResponseStream stream =
      openStream(buildHilogCommand(args), config.streamTimeoutMs);
  string chunk;
  while (nextStreamChunk(&stream, &chunk)) {
    bool keepGoing;
    try {
      keepGoing = callback(chunk);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Hilog callback failed: " << ex.what();
      keepGoing = false;
    }
    if (!keepGoing) {
      LOG(INFO) << "Hilog stream stopped by callback";
      return;
    }
  }
  if (stream.timedOut()) {
    LOG(INFO) << "Hilog stream went quiet after " << stream.getChunkCount()
              << " chunks";
    close();
  }
}

string HdcSession::listJdwp() {
  return executeSingle("jpid", config.commandTimeoutMs);
}

string HdcSession::remount() {
  return executeSingle("target mount", config.commandTimeoutMs);
}

void HdcSession::monitorDevices(int64_t intervalMs,
                                DeviceListCallback callback) {
  DeviceMonitor monitor(socketHandler, endpoint, config);
  monitor.run(intervalMs, callback);
}
}  // namespace hdc
