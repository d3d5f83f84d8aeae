#include "ChannelHandshake.hpp"

#include "PacketCodec.hpp"

namespace hdc {
ChannelHandshake::ChannelHandshake() : receivedWithVersion(true) {
  bytes.fill('\0');
}

ChannelHandshake ChannelHandshake::parse(const string& data) {
  if (data.length() < SIZE_WITHOUT_VERSION) {
    throw HdcException(HdcErrorKind::MALFORMED_HANDSHAKE,
                       "Handshake data too short: expected at least " +
                           to_string(SIZE_WITHOUT_VERSION) + ", got " +
                           to_string(data.length()));
  }
  ChannelHandshake handshake;
  memcpy(&handshake.bytes[0], data.data(), SIZE_WITHOUT_VERSION);
  if (data.length() >= SIZE) {
    memcpy(&handshake.bytes[SIZE_WITHOUT_VERSION],
           data.data() + SIZE_WITHOUT_VERSION, VERSION_SIZE);
    handshake.receivedWithVersion = true;
  } else {
    VLOG(1) << "Received handshake without version field (" << data.length()
            << " bytes)";
    handshake.receivedWithVersion = false;
  }
  return handshake;
}

void ChannelHandshake::verifyBanner() const {
  if (memcmp(&bytes[0], HANDSHAKE_BANNER.data(), HANDSHAKE_BANNER.length()) !=
      0) {
    throw InvalidBannerException(getBanner());
  }
}

string ChannelHandshake::getBanner() const {
  return string(&bytes[0], BANNER_SIZE);
}

void ChannelHandshake::setBanner(const string& banner) {
  writePaddedString(0, BANNER_SIZE, banner);
}

uint32_t ChannelHandshake::getChannelId() const {
  return PacketCodec::readBigEndian32(&bytes[BANNER_SIZE]);
}

void ChannelHandshake::setChannelId(uint32_t channelId) {
  PacketCodec::writeBigEndian32(channelId, &bytes[BANNER_SIZE]);
}

void ChannelHandshake::setConnectKey(const string& connectKey) {
  writePaddedString(BANNER_SIZE, KEY_SIZE, connectKey);
}

string ChannelHandshake::getConnectKey() const {
  return readPaddedString(BANNER_SIZE, KEY_SIZE);
}

string ChannelHandshake::getVersion() const {
  return readPaddedString(SIZE_WITHOUT_VERSION, VERSION_SIZE);
}

void ChannelHandshake::setVersion(const string& version) {
  writePaddedString(SIZE_WITHOUT_VERSION, VERSION_SIZE, version);
}

bool ChannelHandshake::isStableBuffer() const {
  return bytes[BANNER_FEATURE_TAG_OFFSET] != HUGE_BUF_TAG;
}

string ChannelHandshake::serialize() const { return string(&bytes[0], SIZE); }

string ChannelHandshake::serializeWithoutVersion() const {
  return string(&bytes[0], SIZE_WITHOUT_VERSION);
}

string ChannelHandshake::serializeAsReceived() const {
  return receivedWithVersion ? serialize() : serializeWithoutVersion();
}

string ChannelHandshake::readPaddedString(size_t offset, size_t size) const {
  const char* start = &bytes[offset];
  const char* end = static_cast<const char*>(memchr(start, '\0', size));
  return string(start, end ? size_t(end - start) : size);
}

void ChannelHandshake::writePaddedString(size_t offset, size_t size,
                                         const string& value) {
  memset(&bytes[offset], 0, size);
  memcpy(&bytes[offset], value.data(), std::min(size, value.length()));
}
}  // namespace hdc
