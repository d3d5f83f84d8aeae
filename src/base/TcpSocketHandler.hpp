#ifndef __HDC_TCP_SOCKET_HANDLER__
#define __HDC_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace hdc {
/**
 * @brief Connects to the HDC server over TCP (IPv4 or IPv6).
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the endpoint and tries each address in turn, giving up on
   * an address after @p timeoutMs.
   * @return The connected descriptor, or -1 when no address accepted.
   */
  virtual int connect(const SocketEndpoint& endpoint, int64_t timeoutMs);

 protected:
  /**
   * @brief Non-blocking connect to a single resolved address.
   * @return The connected descriptor in blocking mode, or -1.
   */
  int connectToAddress(const addrinfo* address, const SocketEndpoint& endpoint,
                       int64_t timeoutMs);

  /** @brief Disables Nagle so small command frames go out immediately. */
  virtual void initSocket(int fd);
};
}  // namespace hdc

#endif  // __HDC_TCP_SOCKET_HANDLER__
