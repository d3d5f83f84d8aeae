#ifndef __HDC_HEADERS__
#define __HDC_HEADERS__

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "easylogging++.h"

#if !defined(__ANDROID__)
#include "ust.hpp"
#endif

using namespace std;

// Default address of the HDC server on the host
const string HDC_DEFAULT_HOST = "127.0.0.1";
const int HDC_DEFAULT_PORT = 8710;

// Largest payload a single frame may carry (511KB)
const size_t MAX_PACKET_SIZE = 511 * 1024;

// Size of the big-endian length prefix on every frame
const size_t PACKET_LENGTH_SIZE = 4;

#if defined(__ANDROID__)
#define STFATAL LOG(FATAL) << "No Stack Trace on Android" << endl

#define STERROR LOG(ERROR) << "No Stack Trace on Android" << endl
#else
#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()
#endif

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef HDC_CLIENT_VERSION
#define HDC_CLIENT_VERSION "unknown"
#endif

namespace hdc {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  static const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

inline bool startsWith(const string &s, const string &prefix) {
  return s.compare(0, prefix.length(), prefix) == 0;
}

inline string joinStrings(const vector<string> &parts, const string &sep) {
  string retval;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) {
      retval += sep;
    }
    retval += parts[i];
  }
  return retval;
}

inline bool waitOnSocketData(int fd, int64_t timeoutMs) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  VLOG(4) << "Before selecting sockFd";
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  const char *fromEnv = ::getenv("TMPDIR");
  string tmpDir = (fromEnv && *fromEnv) ? fromEnv : _PATH_TMP;
  if (tmpDir.back() != '/') {
    tmpDir += '/';
  }
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace hdc

#endif
