#ifndef __HDC_PACKET_CODEC__
#define __HDC_PACKET_CODEC__

#include "HdcException.hpp"
#include "Headers.hpp"

namespace hdc {
/**
 * @brief Encodes and decodes the length-prefixed frames used for every HDC
 * message.
 *
 * Wire layout:
 *   [4 bytes: payload length, big-endian][payload]
 *
 * The codec keeps no state between calls; each decode owns exactly one frame
 * boundary.
 */
class PacketCodec {
 public:
  /**
   * @brief Prepends the big-endian length to the payload.
   * @throws HdcException (MALFORMED_FRAME) when the payload is larger than
   * MAX_PACKET_SIZE.
   */
  static string encode(const string& payload);

  /**
   * @brief Decodes one complete in-memory frame.
   * @throws HdcException (MALFORMED_FRAME) on a bad length and (IO) when the
   * buffer ends before the frame does.
   */
  static string decode(const string& frame);

  /**
   * @brief Interprets and validates a 4-byte length prefix.
   * @throws HdcException (MALFORMED_FRAME) when the length is zero or larger
   * than MAX_PACKET_SIZE.
   */
  static uint32_t decodeLength(const char* lengthBytes);

  /** @brief Writes @p value as 4 big-endian bytes at @p out. */
  static void writeBigEndian32(uint32_t value, char* out);

  /** @brief Reads 4 big-endian bytes starting at @p in. */
  static uint32_t readBigEndian32(const char* in);
};
}  // namespace hdc

#endif  // __HDC_PACKET_CODEC__
