#ifndef __HDC_FORWARD_NODE__
#define __HDC_FORWARD_NODE__

#include "HdcException.hpp"
#include "Headers.hpp"

namespace hdc {
enum class ForwardNodeKind {
  TCP,
  LOCAL_FILESYSTEM,
  LOCAL_RESERVED,
  LOCAL_ABSTRACT,
  DEV,
  JDWP,
  ARK,
};

/**
 * @brief One end of a port forward, e.g. "tcp:8080" or
 * "ark:1234@5678@Debugger".
 */
class ForwardNode {
 public:
  static ForwardNode tcp(uint16_t port);
  static ForwardNode localFilesystem(const string& name);
  static ForwardNode localReserved(const string& name);
  static ForwardNode localAbstract(const string& name);
  static ForwardNode dev(const string& name);
  /** @brief A debuggable process on the device (remote side only). */
  static ForwardNode jdwp(uint32_t pid);
  /**
   * @brief An Ark debugger endpoint (remote side only).
   * @throws ForwardParseException when @p debugger contains '@'.
   */
  static ForwardNode ark(uint32_t pid, uint32_t tid, const string& debugger);

  /**
   * @brief Parses the canonical textual form.
   * @throws ForwardParseException on an unknown prefix, a bad number or a
   * malformed ark triple.
   */
  static ForwardNode parse(const string& s);

  /** @brief Canonical wire form; parse(toString()) yields an equal node. */
  string toString() const;

  ForwardNodeKind getKind() const { return kind; }
  uint16_t getPort() const { return uint16_t(pid); }
  uint32_t getPid() const { return pid; }
  uint32_t getTid() const { return tid; }
  const string& getName() const { return name; }

  /** @brief JDWP and ARK nodes may only appear on the device side. */
  bool isRemoteOnly() const {
    return kind == ForwardNodeKind::JDWP || kind == ForwardNodeKind::ARK;
  }

  bool operator==(const ForwardNode& other) const {
    return kind == other.kind && pid == other.pid && tid == other.tid &&
           name == other.name;
  }
  bool operator!=(const ForwardNode& other) const { return !(*this == other); }

 protected:
  ForwardNode(ForwardNodeKind _kind, uint32_t _pid, uint32_t _tid,
              const string& _name)
      : kind(_kind), pid(_pid), tid(_tid), name(_name) {}

  ForwardNodeKind kind;
  // Holds the TCP port for TCP nodes
  uint32_t pid;
  uint32_t tid;
  // Socket/device name for named nodes, debugger name for ARK
  string name;
};

inline ostream& operator<<(ostream& os, const ForwardNode& node) {
  return os << node.toString();
}

/**
 * @brief A forward (fport) or reverse (rport) mapping between a local and a
 * remote node.
 */
class ForwardTask {
 public:
  static ForwardTask forward(const ForwardNode& local,
                             const ForwardNode& remote) {
    return ForwardTask(local, remote, true);
  }
  static ForwardTask reverse(const ForwardNode& remote,
                             const ForwardNode& local) {
    return ForwardTask(local, remote, false);
  }

  /**
   * @brief "fport <local> <remote>" for forwards, "rport <remote> <local>"
   * for reverses.
   */
  string toCommandString() const;

  /**
   * @brief "<local> <remote>" regardless of direction. This is the key used
   * to remove the task.
   */
  string taskString() const;

  const ForwardNode& getLocal() const { return local; }
  const ForwardNode& getRemote() const { return remote; }
  bool isForward() const { return forwardDirection; }

 protected:
  ForwardTask(const ForwardNode& _local, const ForwardNode& _remote,
              bool _forwardDirection)
      : local(_local), remote(_remote), forwardDirection(_forwardDirection) {}

  ForwardNode local;
  ForwardNode remote;
  bool forwardDirection;
};
}  // namespace hdc

#endif  // __HDC_FORWARD_NODE__
