#ifndef __HDC_CHANNEL_HANDSHAKE__
#define __HDC_CHANNEL_HANDSHAKE__

#include "HdcException.hpp"
#include "Headers.hpp"

namespace hdc {
// Magic literal that every handshake banner starts with
const string HANDSHAKE_BANNER = "OHOS HDC";

/**
 * @brief Fixed-layout handshake exchanged once per connection.
 *
 * Layout (108 bytes):
 *   [0, 12)   banner: "OHOS HDC" followed by feature bytes
 *   [12, 44)  channel id (server -> client, first 4 bytes big-endian) or
 *             NUL-padded connect key (client -> server)
 *   [44, 108) NUL-padded version string
 *
 * Servers may send the 44-byte short form without the version field; the
 * reply must use the same length or the server's parser breaks.
 */
class ChannelHandshake {
 public:
  static constexpr size_t BANNER_SIZE = 12;
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t VERSION_SIZE = 64;
  static constexpr size_t SIZE = BANNER_SIZE + KEY_SIZE + VERSION_SIZE;
  static constexpr size_t SIZE_WITHOUT_VERSION = BANNER_SIZE + KEY_SIZE;

  /** @brief Offset in the banner of the huge-buffer feature tag. */
  static constexpr size_t BANNER_FEATURE_TAG_OFFSET = 7;
  /** @brief Value of the feature tag when the server uses huge buffers. */
  static constexpr char HUGE_BUF_TAG = '1';

  /** @brief Creates an all-zero handshake. */
  ChannelHandshake();

  /**
   * @brief Parses a received handshake payload (44 or 108+ bytes).
   * @throws HdcException (MALFORMED_HANDSHAKE) when shorter than 44 bytes.
   */
  static ChannelHandshake parse(const string& data);

  /**
   * @throws InvalidBannerException when the banner does not start with
   * HANDSHAKE_BANNER.
   */
  void verifyBanner() const;

  string getBanner() const;
  void setBanner(const string& banner);

  /** @brief Reads the first 4 bytes of the union field as big-endian. */
  uint32_t getChannelId() const;
  void setChannelId(uint32_t channelId);

  /** @brief Clears the union field, then copies at most 32 bytes of key. */
  void setConnectKey(const string& connectKey);
  /** @brief Returns the union field up to the first NUL. */
  string getConnectKey() const;

  string getVersion() const;
  void setVersion(const string& version);

  /** @brief True unless the banner feature tag announces huge buffers. */
  bool isStableBuffer() const;

  /** @brief True when the last parse() input carried a version field. */
  bool hasVersionField() const { return receivedWithVersion; }

  /** @brief Full 108-byte form. */
  string serialize() const;
  /** @brief 44-byte form (banner + union field). */
  string serializeWithoutVersion() const;
  /**
   * @brief Serializes using the same length variant as the handshake that was
   * parsed (44 or 108 bytes).
   */
  string serializeAsReceived() const;

 protected:
  string readPaddedString(size_t offset, size_t size) const;
  void writePaddedString(size_t offset, size_t size, const string& value);

  std::array<char, SIZE> bytes;
  bool receivedWithVersion;
};
}  // namespace hdc

#endif  // __HDC_CHANNEL_HANDSHAKE__
