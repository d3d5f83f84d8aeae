#include "TextUtils.hpp"

namespace hdc {
namespace {
const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at pos, or 0 if invalid.
size_t validSequenceLength(const string& s, size_t pos) {
  auto byteAt = [&s](size_t i) { return uint8_t(s[i]); };
  uint8_t lead = byteAt(pos);
  if (lead < 0x80) {
    return 1;
  }
  size_t length;
  uint8_t lowerBound = 0x80;
  uint8_t upperBound = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      lowerBound = 0xA0;
    } else if (lead == 0xED) {
      upperBound = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      lowerBound = 0x90;
    } else if (lead == 0xF4) {
      upperBound = 0x8F;
    }
  } else {
    return 0;
  }
  if (pos + length > s.length()) {
    return 0;
  }
  uint8_t second = byteAt(pos + 1);
  if (second < lowerBound || second > upperBound) {
    return 0;
  }
  for (size_t i = 2; i < length; ++i) {
    uint8_t continuation = byteAt(pos + i);
    if (continuation < 0x80 || continuation > 0xBF) {
      return 0;
    }
  }
  return length;
}
}  // namespace

bool isValidUtf8(const string& bytes) {
  size_t pos = 0;
  while (pos < bytes.length()) {
    size_t length = validSequenceLength(bytes, pos);
    if (length == 0) {
      return false;
    }
    pos += length;
  }
  return true;
}

string decodeUtf8(const string& bytes) {
  if (!isValidUtf8(bytes)) {
    throw HdcException(HdcErrorKind::TEXT_DECODE,
                       "Response is not valid UTF-8 (" +
                           to_string(bytes.length()) + " bytes)");
  }
  return bytes;
}

string decodeUtf8Lossy(const string& bytes) {
  string retval;
  retval.reserve(bytes.length());
  size_t pos = 0;
  while (pos < bytes.length()) {
    size_t length = validSequenceLength(bytes, pos);
    if (length == 0) {
      retval.append(REPLACEMENT_CHARACTER);
      ++pos;
    } else {
      retval.append(bytes, pos, length);
      pos += length;
    }
  }
  return retval;
}
}  // namespace hdc
