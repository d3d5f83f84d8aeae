#ifndef __HDC_UNIX_SOCKET_HANDLER__
#define __HDC_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace hdc {
/**
 * @brief POSIX socket I/O shared by the concrete handlers.
 *
 * Every descriptor handed out by connect() is tracked with its own mutex so a
 * read, a write and a close on the same socket never interleave.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Closes a tracked descriptor; unknown descriptors are ignored. */
  virtual void close(int fd);

 protected:
  /** @brief Starts tracking a freshly connected descriptor. */
  void addToActiveSockets(int fd);
  /**
   * @brief Mutex guarding @p fd, or null (with errno set to EPIPE) when the
   * descriptor is not tracked.
   */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  /** @brief Per-socket setup run after connecting. */
  virtual void initSocket(int fd);
  void setBlocking(int sockFd, bool blocking);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace hdc

#endif  // __HDC_UNIX_SOCKET_HANDLER__
