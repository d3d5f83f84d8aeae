#include "SocketHandler.hpp"

namespace hdc {
// Longest single select() slice while waiting on a deadline
#define SOCKET_WAIT_SLICE_MS (250)

namespace {
int64_t nowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count,
                            int64_t timeoutMs) {
  int64_t startTime = nowMs();
  size_t pos = 0;
  while (pos < count) {
    int64_t remaining = startTime + timeoutMs - nowMs();
    if (remaining <= 0) {
      VLOG(1) << "Timed out in readAll after " << timeoutMs << " ms (" << pos
              << "/" << count << " bytes)";
      throw HdcException(HdcErrorKind::TIMEOUT, "Operation timed out");
    }
    if (!waitForData(fd, std::min<int64_t>(remaining, SOCKET_WAIT_SLICE_MS))) {
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // The HDC server closes the channel once it is done with a command.
      VLOG(1) << "Connection closed by peer during readAll";
      throw HdcException(HdcErrorKind::IO, "Connection closed by peer");
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        VLOG(2) << "Got EAGAIN, waiting...";
      } else {
        VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
        throw HdcException(HdcErrorKind::IO, string("Failed a call to readAll: ") +
                                                 strerror(localErrno));
      }
    } else {
      pos += bytesRead;
      // Reset the timeout as long as we are reading bytes
      startTime = nowMs();
    }
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    int64_t timeoutMs) {
  int64_t startTime = nowMs();
  size_t pos = 0;
  while (pos < count) {
    if (nowMs() > startTime + timeoutMs) {
      throw HdcException(HdcErrorKind::TIMEOUT, "Socket write timed out");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = GetErrno();
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        VLOG(2) << "Got EAGAIN, waiting...";
        // This is fine, just keep retrying at 100hz
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw HdcException(HdcErrorKind::IO, string("Failed a call to writeAll: ") +
                                                 strerror(localErrno));
      }
    } else if (bytesWritten == 0) {
      throw HdcException(HdcErrorKind::IO, "Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = nowMs();
    }
  }
}
}  // namespace hdc
