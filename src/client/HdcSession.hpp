#ifndef __HDC_SESSION__
#define __HDC_SESSION__

#include "ChannelHandshake.hpp"
#include "ClientConfig.hpp"
#include "ForwardNode.hpp"
#include "HdcException.hpp"
#include "Headers.hpp"
#include "ResponseStream.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"
#include "TransferOptions.hpp"

namespace hdc {
/** @brief Receives one log chunk; return false to stop streaming. */
typedef std::function<bool(const string&)> ChunkCallback;
/** @brief Receives the new device list; return false to stop monitoring. */
typedef std::function<bool(const vector<string>&)> DeviceListCallback;

/**
 * @brief One logical conversation with the HDC server over a single TCP
 * connection.
 *
 * Every new connection starts with the channel handshake. Operations are
 * strictly sequential: a command is sent as one frame and the session then
 * reads one or more response frames according to the operation's completion
 * policy. The server consumes the channel after a shell command, so the
 * session reconnects to the selected device after each one.
 *
 * A session is not thread-safe; run several sessions to talk to the server
 * concurrently.
 */
class HdcSession {
 public:
  HdcSession(shared_ptr<SocketHandler> _socketHandler,
             const SocketEndpoint& _endpoint, const ClientConfig& _config);
  HdcSession(shared_ptr<SocketHandler> _socketHandler,
             const ClientConfig& _config);
  HdcSession(const HdcSession&) = delete;
  HdcSession& operator=(const HdcSession&) = delete;
  virtual ~HdcSession();

  /**
   * @brief Opens a new connection and hand-shakes without selecting a device.
   * @throws HdcException (IO) if the server is unreachable, or any handshake
   * error.
   */
  void connect();

  /**
   * @brief Reconnects and hand-shakes with @p connectKey so that subsequent
   * commands address that device.
   */
  void connectDevice(const string& connectKey);

  /** @brief Drops the socket. Safe to call when already closed. */
  void close();

  bool isConnected() const { return handshakeComplete && socketFd >= 0; }
  uint32_t getChannelId() const { return channelId; }
  /** @brief The device selected by connectDevice(), if any. */
  const optional<string>& getConnectKey() const { return selectedDevice; }
  /** @brief Version string from the server's handshake (may be empty). */
  string getServerVersion() const { return serverHandshake.getVersion(); }
  bool isStableBuffer() const { return serverHandshake.isStableBuffer(); }
  const SocketEndpoint& getEndpoint() const { return endpoint; }

  /**
   * @brief Lists connected devices, one per entry. The "[Empty]" placeholder
   * and blank lines are dropped.
   */
  vector<string> listTargets();
  string checkServer();
  /**
   * @brief Blocks until a device connects and returns its identifier.
   */
  string waitForDevice();

  /**
   * @brief Runs `shell <command>` on the selected device and returns its
   * output. Invalid UTF-8 in the output is replaced rather than rejected.
   */
  string shell(const string& command);
  /** @brief Selects @p connectKey, then sends @p command verbatim. */
  string targetCommand(const string& connectKey, const string& command);
  /** @brief Selects @p connectKey, then runs shell(@p command). */
  string shellOnDevice(const string& connectKey, const string& command);

  string fport(const ForwardNode& local, const ForwardNode& remote);
  string rport(const ForwardNode& remote, const ForwardNode& local);
  string createForward(const ForwardTask& task);
  /**
   * @brief Lists forward tasks for all devices on a separate connection.
   * @throws HdcException (COMMAND_FAILED) when the server answers "[Fail]".
   */
  vector<string> fportList();
  /**
   * @brief Removes the forward identified by ForwardTask::taskString(), on a
   * separate connection.
   */
  string fportRemove(const string& taskString);

  string install(const vector<string>& paths, const InstallOptions& options);
  string uninstall(const string& package, const UninstallOptions& options);

  string fileSend(const string& localPath, const string& remotePath,
                  const FileTransferOptions& options);
  string fileRecv(const string& remotePath, const string& localPath,
                  const FileTransferOptions& options);

  /**
   * @brief Collects log output until the device goes quiet.
   */
  string hilog(const string& args);
  /**
   * @brief Streams log output to @p callback until it returns false (or
   * throws), the server sends an empty chunk or no data arrives in time.
   */
  void hilogStream(const string& args, ChunkCallback callback);

  string listJdwp();
  string remount();

  /**
   * @brief Polls the device list on fresh connections and reports changes.
   * Blocks until @p callback returns false.
   */
  void monitorDevices(int64_t intervalMs, DeviceListCallback callback);

  /**
   * @brief Sends @p command and returns a stream over its responses.
   *
   * The session cannot see reads made through the returned stream; callers
   * should close() it after a timeout or a transport error.
   */
  ResponseStream openStream(const string& command, int64_t timeoutMs);

 protected:
  void openConnection();
  void handshake(const optional<string>& connectKey);
  void reconnectSelectedDevice();
  void requireConnected() const;
  void sendCommand(const string& command);
  /** @brief Reads one frame, closing the connection if the read fails. */
  string readResponse(int64_t timeoutMs);
  /**
   * @brief Advances @p stream, closing the connection on any failure that
   * can leave unread bytes behind.
   */
  bool nextStreamChunk(ResponseStream* stream, string* chunk);
  string executeSingle(const string& command, int64_t timeoutMs);
  string executeMultiFrame(const string& command, int64_t timeoutMs,
                           const vector<string>& markers);
  string executeOnFreshSession(const string& command);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  ClientConfig config;
  int socketFd;
  bool handshakeComplete;
  uint32_t channelId;
  optional<string> selectedDevice;
  ChannelHandshake serverHandshake;
};
}  // namespace hdc

#endif  // __HDC_SESSION__
