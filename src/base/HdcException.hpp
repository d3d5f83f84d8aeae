#ifndef __HDC_EXCEPTION__
#define __HDC_EXCEPTION__

#include "Headers.hpp"

namespace hdc {
/**
 * @brief Categories of failure surfaced by the protocol layer.
 */
enum class HdcErrorKind {
  IO,
  TIMEOUT,
  MALFORMED_FRAME,
  MALFORMED_HANDSHAKE,
  INVALID_BANNER,
  NOT_CONNECTED,
  COMMAND_FAILED,
  ADDRESS_PARSE,
  TEXT_DECODE,
};

inline const char* errorKindToString(HdcErrorKind kind) {
  switch (kind) {
    case HdcErrorKind::IO:
      return "IO";
    case HdcErrorKind::TIMEOUT:
      return "TIMEOUT";
    case HdcErrorKind::MALFORMED_FRAME:
      return "MALFORMED_FRAME";
    case HdcErrorKind::MALFORMED_HANDSHAKE:
      return "MALFORMED_HANDSHAKE";
    case HdcErrorKind::INVALID_BANNER:
      return "INVALID_BANNER";
    case HdcErrorKind::NOT_CONNECTED:
      return "NOT_CONNECTED";
    case HdcErrorKind::COMMAND_FAILED:
      return "COMMAND_FAILED";
    case HdcErrorKind::ADDRESS_PARSE:
      return "ADDRESS_PARSE";
    case HdcErrorKind::TEXT_DECODE:
      return "TEXT_DECODE";
  }
  return "UNKNOWN";
}

/**
 * @brief Base exception for every failure raised while talking to the HDC
 * server.
 */
class HdcException : public std::runtime_error {
 public:
  HdcException(HdcErrorKind _kind, const string& msg)
      : std::runtime_error(msg), kind(_kind) {}

  HdcErrorKind getKind() const { return kind; }

 protected:
  HdcErrorKind kind;
};

/**
 * @brief Thrown when the handshake banner does not start with the magic
 * literal.  Keeps the raw banner bytes for diagnostics.
 */
class InvalidBannerException : public HdcException {
 public:
  explicit InvalidBannerException(const string& _banner)
      : HdcException(HdcErrorKind::INVALID_BANNER,
                     "Invalid banner: expected 'OHOS HDC', got " +
                         describeBytes(_banner)),
        banner(_banner) {}

  const string& getBanner() const { return banner; }

 private:
  static string describeBytes(const string& bytes) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < bytes.size(); ++i) {
      if (i) {
        oss << ", ";
      }
      oss << int(uint8_t(bytes[i]));
    }
    oss << "]";
    return oss.str();
  }

  string banner;
};

/**
 * @brief Thrown when a forward address string cannot be parsed.
 */
class ForwardParseException : public HdcException {
 public:
  explicit ForwardParseException(const string& msg)
      : HdcException(HdcErrorKind::ADDRESS_PARSE, msg) {}
};
}  // namespace hdc

#endif  // __HDC_EXCEPTION__
