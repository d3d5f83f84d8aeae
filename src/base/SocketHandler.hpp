#ifndef __HDC_SOCKET_HANDLER__
#define __HDC_SOCKET_HANDLER__

#include "HdcException.hpp"
#include "Headers.hpp"
#include "PacketCodec.hpp"
#include "SocketEndpoint.hpp"

namespace hdc {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks for at most @p timeoutMs until the descriptor is readable.
   */
  virtual bool waitForData(int fd, int64_t timeoutMs) {
    return waitOnSocketData(fd, timeoutMs);
  }
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeoutMs Longest time to wait without receiving any byte.
   * @throws HdcException TIMEOUT when no progress is made in time, IO when the
   * peer closes the stream or the read fails.
   */
  void readAll(int fd, void* buf, size_t count, int64_t timeoutMs);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count,
                       int64_t timeoutMs);

  /**
   * @brief Reads one length-prefixed frame and returns its payload.
   * @throws HdcException MALFORMED_FRAME on a zero or oversized length.
   */
  inline string readPacket(int fd, int64_t timeoutMs) {
    char lengthBytes[PACKET_LENGTH_SIZE];
    readAll(fd, lengthBytes, PACKET_LENGTH_SIZE, timeoutMs);
    uint32_t length = PacketCodec::decodeLength(lengthBytes);
    string s(length, '\0');
    readAll(fd, &s[0], length, timeoutMs);
    VLOG(3) << "Decoded packet: size=" << length;
    return s;
  }

  /**
   * @brief Frames and writes one payload.
   */
  inline void writePacket(int fd, const string& payload, int64_t timeoutMs) {
    string frame = PacketCodec::encode(payload);
    writeAllOrThrow(fd, frame.data(), frame.length(), timeoutMs);
    VLOG(3) << "Wrote packet: " << frame.length()
            << " bytes (data: " << payload.length() << " bytes)";
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint, int64_t timeoutMs) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace hdc

#endif  // __HDC_SOCKET_HANDLER__
