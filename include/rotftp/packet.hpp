#ifndef __ROTFTP_PACKET_HPP__
#define __ROTFTP_PACKET_HPP__

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "rotftp/exception.hpp"
#include "rotftp/project_config.hpp"

/* packet provides ability to manipulate data packets for tftp transactions
 *
 *      +-----------+       +---------------+       +-----------+
 *      | data_1    |       |               |       | header    |
 *      | data_2    |------>| Conversion    |------>|-----------+
 *      | ...       |<------| engine        |<------| body      |
 *      |           |       |               |       |..         |
 *      +-----------+       +---------------+       +-----------+
 *      Structured                                  Raw packet for
 *      Data                                        Network
 * []_packet structures denote a network packet. A network packet can be seen as in two form
 * structured form where we can get individual entries of the packet or network form where data
 * is suitable for transaction but not easy to use from application usage point of view.
 * []_packet structues allow creation(construction) of packet either via structured information
 * or directly from raw packet. This provides an implicit coversion engine between two
 * representation of a packet.
 * Class heirarchy
 * base_packet
 *      |
 *      |____________________________________________
 *      |           |               |               |
 *  rrq_packet  data_packet     ack_packet      err_packet
 *
 *  Each child object represent one kind of packet as per RFC1350. Write request is not part of
 *  the hierarchy, this server never accepts uploads.
 *  All packet expose following APIs
 *  1.  Constructor to create packet object from minimal required data. For example to create a
 *      ack_packet user need to provide block_number.
 *  2.  Constructor to create packet object from raw network buffer. It throws one of the
 *      framing_exception types if the buffer is not a valid packet of that kind.
 *  3.  method to create raw network buffer for packet for packet object.
 *  Here '1' and '3' gives ability to go from left to right and '2' allows conversion from right
 *  to left. Encoding never changes the packet, the same data_packet always yields the same bytes.
 */

namespace rotftp {
namespace packet {
constexpr std::size_t delimiter_len    = 0x01;
constexpr uint8_t delimiter            = 0x00;

constexpr std::size_t opcode_len       = 0x02;
constexpr std::size_t block_number_len = 0x02;
constexpr std::size_t error_code_len   = 0x02;
constexpr std::size_t header_len       = opcode_len + block_number_len;

constexpr std::size_t max_data_len     = ROTFTP_MAX_DATA_LEN;
constexpr std::size_t max_datagram_len = ROTFTP_MAX_DATAGRAM_LEN;
static_assert(max_datagram_len == header_len + max_data_len, "datagram must fit header and one block");

enum class opcode : uint16_t {
  rrq  = 0x01,
  wrq  = 0x02,
  data = 0x03,
  ack  = 0x04,
  err  = 0x05,
};

enum class error_code : uint16_t {
  unknown = 0x01,
  not_found,
  access_violation,
  disk_full,
  illegal_operation,
  unknown_transfer_id,
  file_already_exists,
  no_such_user,
};

constexpr std::size_t error_code_count = 8;

namespace mode {
constexpr std::string_view octet = "octet";
}

typedef std::vector<uint8_t> bytes;
typedef std::span<const uint8_t> const_view;

template <typename T>
std::pair<uint8_t, uint8_t> u8_pair(const T &t) {
  static_assert(std::is_same<uint16_t, T>::value || std::is_same<opcode, T>::value ||
                    std::is_same<error_code, T>::value,
                "Can't data into uint8_t pair");

  const uint16_t u16_val = static_cast<uint16_t>(t);
  return std::make_pair(static_cast<uint8_t>((u16_val >> 0x08) & 0xFF), static_cast<uint8_t>(u16_val & 0xFF));
}

inline uint16_t get_u16(const const_view::iterator &it) {
  return ((static_cast<uint16_t>(*it) << 0x08) | static_cast<uint16_t>(*(it + 1)));
}

/* gives opcode for given packet. Throws partial_frame_exception if buffer can't even hold an opcode
 */
opcode get_opcode(const_view buf);

/* Human readable description of an error code, as sent when error packet carries no message
 */
std::string_view describe(const error_code &ec) noexcept;

struct base_packet {
  virtual ~base_packet() = default;
  virtual bytes buffer() const = 0;
};

struct rrq_packet final : public base_packet {
  std::string filename;
  std::string mode;

  /* mode defaults to octet when empty. Throws invalid_frame_parameter_exception for an empty
   * filename or for strings carrying a NUL byte.
   */
  rrq_packet(const std::string &filename, const std::string &mode = "");

  explicit rrq_packet(const_view buf);

  bytes buffer() const override;
};

struct data_packet final : public base_packet {
  uint16_t block_number;
  // Not owned. Points into the served payload when encoding and into received buffer when decoding
  const_view data;

  data_packet(const uint16_t &block_number, const_view data);

  explicit data_packet(const_view buf);

  // Final block of a transfer is the one with less than max_data_len bytes
  bool is_last() const noexcept { return this->data.size() < max_data_len; }

  bytes buffer() const override;
};

struct ack_packet final : public base_packet {
  uint16_t block_number;

  ack_packet(const uint16_t &block_number) : block_number(block_number) {}

  explicit ack_packet(const_view buf);

  bytes buffer() const override;
};

struct err_packet final : public base_packet {
  error_code ec;
  std::string message;

  // Empty message is replaced by description of ec
  err_packet(const error_code &ec, const std::string &message = "");

  explicit err_packet(const_view buf);

  bytes buffer() const override;
};

typedef std::variant<rrq_packet, data_packet, ack_packet, err_packet> any_packet;

/* Decodes any packet this server understands. Dispatches on opcode and throws framing_exception
 * for write requests, unknown op codes or malformed packets.
 */
any_packet parse(const_view buf);

} // namespace packet
} // namespace rotftp
#endif
