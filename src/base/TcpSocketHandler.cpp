#include "TcpSocketHandler.hpp"

namespace hdc {
namespace {
bool waitUntilWritable(int fd, int64_t timeoutMs) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, NULL, &fdset, NULL, &tv);
  return rc > 0 && FD_ISSET(fd, &fdset);
}
}  // namespace

TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint& endpoint,
                              int64_t timeoutMs) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
#if __NetBSD__
  hints.ai_flags = AI_ADDRCONFIG;
#else
  hints.ai_flags = (AI_V4MAPPED | AI_ADDRCONFIG);
#endif

  addrinfo* results = NULL;
  int rc = getaddrinfo(endpoint.getName().c_str(),
                       to_string(endpoint.getPort()).c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  int sockFd = -1;
  for (addrinfo* p = results; p != NULL && sockFd == -1; p = p->ai_next) {
    sockFd = connectToAddress(p, endpoint, timeoutMs);
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to HDC server at " << endpoint;
    return -1;
  }
  LOG(INFO) << "Connected to HDC server at " << endpoint << " using fd "
            << sockFd;
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

int TcpSocketHandler::connectToAddress(const addrinfo* address,
                                       const SocketEndpoint& endpoint,
                                       int64_t timeoutMs) {
  int sockFd =
      socket(address->ai_family, address->ai_socktype, address->ai_protocol);
  if (sockFd == -1) {
    LOG(INFO) << "Error creating socket: " << strerror(GetErrno());
    return -1;
  }

  setBlocking(sockFd, false);
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1 &&
      GetErrno() != EINPROGRESS) {
    VLOG(1) << "Connect to " << endpoint
            << " failed: " << strerror(GetErrno());
    ::close(sockFd);
    return -1;
  }
  if (!waitUntilWritable(sockFd, timeoutMs)) {
    LOG(INFO) << "Timed out connecting to " << endpoint << " after "
              << timeoutMs << " ms";
    ::close(sockFd);
    return -1;
  }

  int soError = 0;
  socklen_t len = sizeof(soError);
  FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &soError, &len));
  if (soError != 0) {
    VLOG(1) << "Connect to " << endpoint << " failed: " << strerror(soError);
    ::close(sockFd);
    return -1;
  }

  // Reads are bounded by select() deadlines
  setBlocking(sockFd, true);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char*)&flag, sizeof(int)));
}
}  // namespace hdc
