#include "ResponseStream.hpp"

#include "HdcCommand.hpp"
#include "TextUtils.hpp"

namespace hdc {
string responseToText(const string& payload) {
  return decodeUtf8(stripResponsePrefix(payload));
}

ResponseStream::ResponseStream(shared_ptr<SocketHandler> _socketHandler,
                               int _socketFd, int64_t _timeoutMs)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      timeoutMs(_timeoutMs),
      finished(false),
      endedByTimeout(false),
      chunkCount(0) {}

bool ResponseStream::next(string* chunk) {
  if (finished) {
    return false;
  }
  string payload;
  try {
    payload = socketHandler->readPacket(socketFd, timeoutMs);
  } catch (const HdcException& ex) {
    if (ex.getKind() != HdcErrorKind::TIMEOUT) {
      finished = true;
      throw;
    }
    VLOG(1) << "Response stream timed out after " << chunkCount << " chunks";
    finished = true;
    endedByTimeout = true;
    return false;
  }
  string text;
  try {
    text = responseToText(payload);
  } catch (const HdcException&) {
    finished = true;
    throw;
  }
  if (text.empty()) {
    VLOG(1) << "Response stream ended with an empty chunk";
    finished = true;
    return false;
  }
  ++chunkCount;
  *chunk = text;
  return true;
}
}  // namespace hdc
