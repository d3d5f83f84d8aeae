#include "UnixSocketHandler.hpp"

namespace hdc {
UnixSocketHandler::UnixSocketHandler() {}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  if (fd < 0) {
    STFATAL << "Invalid socket descriptor: " << fd;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    VLOG(1) << "Socket " << fd << " is not open";
    SetErrno(EPIPE);
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void* buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t bytesRead = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  VLOG(4) << "Read " << bytesRead << " bytes from fd " << fd;
  SetErrno(localErrno);
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void* buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Writing " << count << " bytes to fd " << fd;
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (!activeSocketMutexes.emplace(fd, make_shared<recursive_mutex>()).second) {
    STFATAL << "Socket already tracked: " << fd;
  }
}

void UnixSocketHandler::close(int fd) {
  if (fd < 0) {
    return;
  }
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    LOG(WARNING) << "Tried to close a socket that is not open: " << fd;
    return;
  }
  {
    lock_guard<std::recursive_mutex> guard(*(it->second));
    VLOG(1) << "Closing socket " << fd;
    FATAL_FAIL(::close(fd));
  }
  activeSocketMutexes.erase(it);
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  int val = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void*)&val, sizeof(val)) ==
      -1) {
    ::signal(SIGPIPE, SIG_IGN);
  }
#endif
}

void UnixSocketHandler::setBlocking(int sockFd, bool blocking) {
  int opts = fcntl(sockFd, F_GETFL);
  FATAL_FAIL(opts);
  opts = blocking ? (opts & ~O_NONBLOCK) : (opts | O_NONBLOCK);
  FATAL_FAIL(fcntl(sockFd, F_SETFL, opts));
}
}  // namespace hdc
