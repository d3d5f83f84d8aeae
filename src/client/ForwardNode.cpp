#include "ForwardNode.hpp"

namespace hdc {
namespace {
const string TCP_PREFIX = "tcp:";
const string LOCAL_FILESYSTEM_PREFIX = "localfilesystem:";
const string LOCAL_RESERVED_PREFIX = "localreserved:";
const string LOCAL_ABSTRACT_PREFIX = "localabstract:";
const string DEV_PREFIX = "dev:";
const string JDWP_PREFIX = "jdwp:";
const string ARK_PREFIX = "ark:";

uint32_t parseUnsigned(const string& s, uint32_t maxValue, const string& what) {
  if (s.empty() || s.length() > 10 ||
      s.find_first_not_of("0123456789") != string::npos) {
    throw ForwardParseException("Invalid " + what + ": " + s);
  }
  uint64_t value = stoull(s);
  if (value > maxValue) {
    throw ForwardParseException("Invalid " + what + ": " + s);
  }
  return uint32_t(value);
}
}  // namespace

ForwardNode ForwardNode::tcp(uint16_t port) {
  return ForwardNode(ForwardNodeKind::TCP, port, 0, "");
}

ForwardNode ForwardNode::localFilesystem(const string& name) {
  return ForwardNode(ForwardNodeKind::LOCAL_FILESYSTEM, 0, 0, name);
}

ForwardNode ForwardNode::localReserved(const string& name) {
  return ForwardNode(ForwardNodeKind::LOCAL_RESERVED, 0, 0, name);
}

ForwardNode ForwardNode::localAbstract(const string& name) {
  return ForwardNode(ForwardNodeKind::LOCAL_ABSTRACT, 0, 0, name);
}

ForwardNode ForwardNode::dev(const string& name) {
  return ForwardNode(ForwardNodeKind::DEV, 0, 0, name);
}

ForwardNode ForwardNode::jdwp(uint32_t pid) {
  return ForwardNode(ForwardNodeKind::JDWP, pid, 0, "");
}

ForwardNode ForwardNode::ark(uint32_t pid, uint32_t tid,
                             const string& debugger) {
  // '@' separates the fields of the wire form
  if (debugger.find('@') != string::npos) {
    throw ForwardParseException("Invalid Ark debugger name: " + debugger);
  }
  return ForwardNode(ForwardNodeKind::ARK, pid, tid, debugger);
}

ForwardNode ForwardNode::parse(const string& s) {
  if (startsWith(s, TCP_PREFIX)) {
    return tcp(uint16_t(
        parseUnsigned(s.substr(TCP_PREFIX.length()), 65535, "TCP port")));
  }
  if (startsWith(s, LOCAL_FILESYSTEM_PREFIX)) {
    return localFilesystem(s.substr(LOCAL_FILESYSTEM_PREFIX.length()));
  }
  if (startsWith(s, LOCAL_RESERVED_PREFIX)) {
    return localReserved(s.substr(LOCAL_RESERVED_PREFIX.length()));
  }
  if (startsWith(s, LOCAL_ABSTRACT_PREFIX)) {
    return localAbstract(s.substr(LOCAL_ABSTRACT_PREFIX.length()));
  }
  if (startsWith(s, DEV_PREFIX)) {
    return dev(s.substr(DEV_PREFIX.length()));
  }
  if (startsWith(s, JDWP_PREFIX)) {
    return jdwp(
        parseUnsigned(s.substr(JDWP_PREFIX.length()), UINT32_MAX, "JDWP pid"));
  }
  if (startsWith(s, ARK_PREFIX)) {
    string arkString = s.substr(ARK_PREFIX.length());
    // split() drops a trailing empty field, so count separators instead
    if (std::count(arkString.begin(), arkString.end(), '@') != 2) {
      throw ForwardParseException(
          "Invalid ark format: expected pid@tid@debugger, got " + arkString);
    }
    auto first = arkString.find('@');
    auto second = arkString.find('@', first + 1);
    uint32_t pid = parseUnsigned(arkString.substr(0, first), UINT32_MAX,
                                 "pid in ark");
    uint32_t tid = parseUnsigned(
        arkString.substr(first + 1, second - first - 1), UINT32_MAX,
        "tid in ark");
    return ark(pid, tid, arkString.substr(second + 1));
  }
  throw ForwardParseException("Invalid forward node format: " + s);
}

string ForwardNode::toString() const {
  switch (kind) {
    case ForwardNodeKind::TCP:
      return TCP_PREFIX + to_string(pid);
    case ForwardNodeKind::LOCAL_FILESYSTEM:
      return LOCAL_FILESYSTEM_PREFIX + name;
    case ForwardNodeKind::LOCAL_RESERVED:
      return LOCAL_RESERVED_PREFIX + name;
    case ForwardNodeKind::LOCAL_ABSTRACT:
      return LOCAL_ABSTRACT_PREFIX + name;
    case ForwardNodeKind::DEV:
      return DEV_PREFIX + name;
    case ForwardNodeKind::JDWP:
      return JDWP_PREFIX + to_string(pid);
    case ForwardNodeKind::ARK:
      return ARK_PREFIX + to_string(pid) + "@" + to_string(tid) + "@" + name;
  }
  return "";
}

string ForwardTask::toCommandString() const {
  if (forwardDirection) {
    return "fport " + local.toString() + " " + remote.toString();
  }
  return "rport " + remote.toString() + " " + local.toString();
}

string ForwardTask::taskString() const {
  return local.toString() + " " + remote.toString();
}
}  // namespace hdc
