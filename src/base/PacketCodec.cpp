#include "PacketCodec.hpp"

namespace hdc {
string PacketCodec::encode(const string& payload) {
  if (payload.length() > MAX_PACKET_SIZE) {
    throw HdcException(HdcErrorKind::MALFORMED_FRAME,
                       "Data size " + to_string(payload.length()) +
                           " exceeds maximum packet size " +
                           to_string(MAX_PACKET_SIZE));
  }
  string frame(PACKET_LENGTH_SIZE, '\0');
  writeBigEndian32(uint32_t(payload.length()), &frame[0]);
  frame.append(payload);
  VLOG(3) << "Encoded packet: size=" << payload.length();
  return frame;
}

string PacketCodec::decode(const string& frame) {
  if (frame.length() < PACKET_LENGTH_SIZE) {
    throw HdcException(HdcErrorKind::IO,
                       "Stream ended while reading the packet length");
  }
  uint32_t length = decodeLength(frame.data());
  if (frame.length() - PACKET_LENGTH_SIZE < length) {
    throw HdcException(HdcErrorKind::IO,
                       "Stream ended while reading the packet payload");
  }
  return frame.substr(PACKET_LENGTH_SIZE, length);
}

uint32_t PacketCodec::decodeLength(const char* lengthBytes) {
  uint32_t length = readBigEndian32(lengthBytes);
  if (length == 0) {
    throw HdcException(HdcErrorKind::MALFORMED_FRAME,
                       "Received zero-length packet");
  }
  if (length > MAX_PACKET_SIZE) {
    throw HdcException(HdcErrorKind::MALFORMED_FRAME,
                       "Packet size " + to_string(length) +
                           " exceeds maximum " + to_string(MAX_PACKET_SIZE));
  }
  return length;
}

void PacketCodec::writeBigEndian32(uint32_t value, char* out) {
  out[0] = char((value >> 24) & 0xFF);
  out[1] = char((value >> 16) & 0xFF);
  out[2] = char((value >> 8) & 0xFF);
  out[3] = char(value & 0xFF);
}

uint32_t PacketCodec::readBigEndian32(const char* in) {
  return (uint32_t(uint8_t(in[0])) << 24) | (uint32_t(uint8_t(in[1])) << 16) |
         (uint32_t(uint8_t(in[2])) << 8) | uint32_t(uint8_t(in[3]));
}
}  // namespace hdc
