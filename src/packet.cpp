#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

#include "rotftp/exception.hpp"
#include "rotftp/packet.hpp"

using namespace rotftp;
using namespace rotftp::packet;

static constexpr std::array<std::string_view, error_code_count> ec_desc = {
    "Undefined. Please check error message(if any)",
    "File not found",
    "Access violation",
    "Disk full or allocation exceeded",
    "Illegal TFTP operation",
    "Unknown transfer ID",
    "File already exists",
    "No such user",
};

static bool iequals(std::string_view a, std::string_view b) {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

static void append_u16(bytes &buf, const std::pair<uint8_t, uint8_t> &u8) {
  buf.push_back(u8.first);
  buf.push_back(u8.second);
}

static void append_string(bytes &buf, std::string_view str) {
  std::for_each(str.cbegin(), str.cend(), [&](const char &ch) { buf.push_back(static_cast<uint8_t>(ch)); });
  buf.push_back(delimiter);
}

/* Reads a NUL terminated string starting at itr. itr is moved past the delimiter.
 */
static std::string read_string(const const_view &buf, const_view::iterator &itr, const char *field) {
  auto delim_itr = std::find(itr, buf.end(), delimiter);
  if (delim_itr == buf.end()) {
    throw partial_frame_exception(std::string(field) + " is not NUL terminated");
  }
  std::string value(itr, delim_itr);
  itr = delim_itr + delimiter_len;
  return value;
}

static void expect_opcode(const_view buf, const opcode &expected) {
  if (buf.size() > max_datagram_len) {
    std::stringstream ss;
    ss << "Frame of " << buf.size() << " bytes exceeds maximum datagram size " << max_datagram_len;
    throw oversized_frame_exception(ss.str());
  }
  auto oc = get_opcode(buf);
  if (oc != expected) {
    std::stringstream ss;
    ss << "Expected op code " << static_cast<uint16_t>(expected) << " Got " << static_cast<uint16_t>(oc);
    throw frame_type_mismatch_exception(ss.str());
  }
}

opcode packet::get_opcode(const_view buf) {
  if (buf.size() < opcode_len) {
    throw partial_frame_exception("Can't parse frame with length smaller than op code");
  }
  return static_cast<opcode>(get_u16(buf.begin()));
}

std::string_view packet::describe(const error_code &ec) noexcept {
  auto index = static_cast<std::size_t>(ec) - static_cast<std::size_t>(error_code::unknown);
  if (index < ec_desc.size()) {
    return ec_desc[index];
  }
  return "Unknown error occured";
}

//-----------------------------------------------------------------------------
rrq_packet::rrq_packet(const std::string &filename, const std::string &mode)
    : filename(filename),
      mode(mode.empty() ? std::string(packet::mode::octet) : mode) {
  if (this->filename.empty()) {
    throw invalid_frame_parameter_exception("file name can't be empty");
  }
  if (this->filename.find('\0') != std::string::npos || this->mode.find('\0') != std::string::npos) {
    throw invalid_frame_parameter_exception("file name and mode can't carry NUL");
  }
}

rrq_packet::rrq_packet(const_view buf) {
  expect_opcode(buf, opcode::rrq);
  auto itr       = buf.begin() + opcode_len;
  this->filename = read_string(buf, itr, "file name");
  if (this->filename.empty()) {
    throw invalid_frame_parameter_exception("Empty file name in read request");
  }
  this->mode = read_string(buf, itr, "mode");
  if (this->mode.empty()) {
    throw invalid_frame_parameter_exception("Empty mode in read request");
  }
  if (!iequals(this->mode, packet::mode::octet)) {
    throw invalid_frame_parameter_exception("Only octet mode is supported, got " + this->mode);
  }
  // Anything after mode are RFC2347 options. They are not negotiated and so ignored
}

bytes rrq_packet::buffer() const {
  bytes buf;
  buf.reserve(opcode_len + this->filename.size() + this->mode.size() + 2 * delimiter_len);
  append_u16(buf, u8_pair(opcode::rrq));
  append_string(buf, this->filename);
  append_string(buf, this->mode);
  return buf;
}

//-----------------------------------------------------------------------------
data_packet::data_packet(const uint16_t &block_number, const_view data)
    : block_number(block_number),
      data(data) {
  if (data.size() > max_data_len) {
    throw invalid_frame_parameter_exception("data block can't be larger than 512 bytes");
  }
}

data_packet::data_packet(const_view buf) {
  // Size is checked before anything else, an oversized frame is never looked into
  expect_opcode(buf, opcode::data);
  if (buf.size() < header_len) {
    throw partial_frame_exception("No block number in data packet");
  }
  this->block_number = get_u16(buf.begin() + opcode_len);
  this->data         = buf.subspan(header_len);
}

bytes data_packet::buffer() const {
  bytes buf;
  buf.reserve(header_len + this->data.size());
  append_u16(buf, u8_pair(opcode::data));
  append_u16(buf, u8_pair(this->block_number));
  buf.insert(buf.end(), this->data.begin(), this->data.end());
  return buf;
}

//-----------------------------------------------------------------------------
ack_packet::ack_packet(const_view buf) {
  expect_opcode(buf, opcode::ack);
  // Bytes after block number are padding some clients send, they carry nothing
  if (buf.size() < header_len) {
    throw partial_frame_exception("No block number in ack packet");
  }
  this->block_number = get_u16(buf.begin() + opcode_len);
}

bytes ack_packet::buffer() const {
  bytes buf;
  buf.reserve(header_len);
  append_u16(buf, u8_pair(opcode::ack));
  append_u16(buf, u8_pair(this->block_number));
  return buf;
}

//-----------------------------------------------------------------------------
err_packet::err_packet(const error_code &ec, const std::string &message)
    : ec(ec),
      message(message.empty() ? std::string(describe(ec)) : message) {
  if (this->message.find('\0') != std::string::npos) {
    throw invalid_frame_parameter_exception("error message can't carry NUL");
  }
}

err_packet::err_packet(const_view buf) {
  expect_opcode(buf, opcode::err);
  if (buf.size() < opcode_len + error_code_len) {
    throw partial_frame_exception("No error code in error packet");
  }
  this->ec      = static_cast<error_code>(get_u16(buf.begin() + opcode_len));
  auto itr      = buf.begin() + opcode_len + error_code_len;
  this->message = read_string(buf, itr, "error message");
}

bytes err_packet::buffer() const {
  bytes buf;
  buf.reserve(opcode_len + error_code_len + this->message.size() + delimiter_len);
  append_u16(buf, u8_pair(opcode::err));
  append_u16(buf, u8_pair(this->ec));
  append_string(buf, this->message);
  return buf;
}

//-----------------------------------------------------------------------------
any_packet packet::parse(const_view buf) {
  if (buf.size() > max_datagram_len) {
    throw oversized_frame_exception("Frame exceeds maximum datagram size");
  }
  switch (get_opcode(buf)) {
  case opcode::rrq:
    return rrq_packet(buf);
  case opcode::data:
    return data_packet(buf);
  case opcode::ack:
    return ack_packet(buf);
  case opcode::err:
    return err_packet(buf);
  case opcode::wrq:
    throw invalid_frame_parameter_exception("Write requests are not supported");
  default:
    break;
  }
  throw invalid_frame_parameter_exception("Invalid OP code");
}
