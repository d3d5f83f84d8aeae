#ifndef __HDC_RESPONSE_STREAM__
#define __HDC_RESPONSE_STREAM__

#include "HdcException.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace hdc {
/**
 * @brief Converts a raw response payload to text: strips a recognized command
 * prefix, then validates UTF-8.
 * @throws HdcException (TEXT_DECODE) on invalid UTF-8.
 */
string responseToText(const string& payload);

/**
 * @brief Lazily reads response chunks from a socket after a command has been
 * sent.
 *
 * The stream ends on an empty chunk or when no frame arrives within the
 * per-chunk timeout. Any other failure (closed socket, bad frame, bad text) is
 * thrown from next().
 */
class ResponseStream {
 public:
  ResponseStream(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
                 int64_t _timeoutMs);

  /**
   * @brief Reads the next chunk.
   * @return false once the stream has ended, in which case @p chunk is left
   * untouched.
   */
  bool next(string* chunk);

  /** @brief True when the stream ended because a read timed out. */
  bool timedOut() const { return endedByTimeout; }

  bool isFinished() const { return finished; }

  int64_t getChunkCount() const { return chunkCount; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  int64_t timeoutMs;
  bool finished;
  bool endedByTimeout;
  int64_t chunkCount;
};
}  // namespace hdc

#endif  // __HDC_RESPONSE_STREAM__
