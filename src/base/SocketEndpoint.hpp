#ifndef __HDC_SOCKET_ENDPOINT__
#define __HDC_SOCKET_ENDPOINT__

#include "HdcException.hpp"
#include "Headers.hpp"

namespace hdc {
class SocketEndpoint {
 public:
  SocketEndpoint() : name(HDC_DEFAULT_HOST), port(HDC_DEFAULT_PORT) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  /**
   * @brief Parses "host:port" (or "[v6]:port"); a bare host keeps the default
   * port.
   */
  static SocketEndpoint parse(const string &address) {
    auto colon = address.rfind(':');
    if (colon == string::npos || address.find(']', colon) != string::npos) {
      return SocketEndpoint(stripBrackets(address), HDC_DEFAULT_PORT);
    }
    string host = stripBrackets(address.substr(0, colon));
    string portString = address.substr(colon + 1);
    int port;
    try {
      size_t used = 0;
      port = stoi(portString, &used);
      if (used != portString.length()) {
        throw std::invalid_argument(portString);
      }
    } catch (const std::logic_error &) {
      throw HdcException(HdcErrorKind::ADDRESS_PARSE,
                         "Invalid port in address: " + address);
    }
    if (port <= 0 || port > 65535) {
      throw HdcException(HdcErrorKind::ADDRESS_PARSE,
                         "Invalid port in address: " + address);
    }
    return SocketEndpoint(host, port);
  }

 protected:
  static string stripBrackets(const string &host) {
    if (host.length() >= 2 && host.front() == '[' && host.back() == ']') {
      return host.substr(1, host.length() - 2);
    }
    return host;
  }

  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace hdc

#endif  // __HDC_SOCKET_ENDPOINT__
