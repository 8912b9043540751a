#ifndef __TB_PACKET_H__
#define __TB_PACKET_H__

#include "Headers.hpp"

namespace tb {
/**
 * @brief A typed message on the stream socket: one header byte and a payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error if the buffer has no header byte.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.length() < HEADER_SIZE) {
      throw std::runtime_error("Packet is too short");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const { return string(1, char(header)) + payload; }

 protected:
  static const size_t HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace tb

#endif  // __TB_PACKET_H__
