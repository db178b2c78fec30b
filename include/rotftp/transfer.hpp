#ifndef __ROTFTP_TRANSFER_HPP__
#define __ROTFTP_TRANSFER_HPP__

#include <array>
#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>

#include "rotftp/common.hpp"
#include "rotftp/error_code.hpp"
#include "rotftp/network_io.hpp"
#include "rotftp/packet.hpp"
#include "rotftp/project_config.hpp"

namespace rotftp {

class transfer;
typedef std::shared_ptr<transfer> transfer_s;

// Served bytes. Shared by every transfer, never modified once loaded
typedef std::shared_ptr<const packet::bytes> payload_s;

/* Invoked once when transfer ends. blocks_sent is the number of the last block put on the wire
 */
typedef std::function<void(const udp::endpoint &remote_endpoint, error_code e, uint16_t blocks_sent)>
    transfer_completion_cb;

class transfer_config : public base_config {
public:
  transfer_config(const udp::endpoint &remote_endpoint,
                  payload_s payload,
                  transfer_completion_cb callback  = nullptr,
                  const ms_duration network_timeout = ms_duration(ROTFTP_CONF_NETWORK_TIMEOUT),
                  const uint16_t max_retry_count    = ROTFTP_CONF_MAX_RETRY_COUNT,
                  const std::string &filename       = "")
      : base_config(remote_endpoint, network_timeout, max_retry_count),
        payload(payload),
        callback(callback),
        filename(filename) {}

  payload_s payload;
  transfer_completion_cb callback;
  // Name client asked for. Only used for logging, every request is served the same payload
  std::string filename;
};

/* transfer drives one download to completion over a channel dedicated to one client.
 *
 *   sending_block ---> awaiting_ack ---+---> done     (final block acknowledged)
 *        ^                 |  ^        |
 *        |   ack(block)    |  | stale  +---> failed   (retries exhausted, error packet, network error, abort)
 *        +-----------------+  | ack, bad packet, unknown sender, timeout with budget left (block is resent)
 *                             +---------
 *
 * Block numbers are allocated here, the data packet is encoded once per block and the same bytes are
 * resent on timeout. Object keeps itself alive through pending asio operations, caller may drop its
 * transfer_s after start().
 */
class transfer : public base_worker, public std::enable_shared_from_this<transfer> {
public:
  enum state { sending_block, awaiting_ack, done, failed };

  static transfer_s create(boost::asio::io_context &io, const transfer_config &config);

  void start() override;

  // Safe to call from any thread. Transfer ends with error::user_requested_abort
  void abort() override;

  state get_state() const { return this->current_state; }

  // Transfer id (local port) client is talking to
  udp::endpoint local_endpoint() const { return this->channel.local_endpoint(); }

  ~transfer() override;

private:
  transfer(boost::asio::io_context &io, const transfer_config &config);

  void send_data(const bool &resend = false);
  void send_data_cb(const boost::system::error_code &error, const std::size_t &bytes_sent);
  void receive_ack();
  void receive_ack_cb(const boost::system::error_code &error, const std::size_t &bytes_received);
  // Answers a datagram that didn't come from the peer with an unknown transfer id error
  void reject_sender();
  void exit(error_code e) override;

  boost::asio::io_context &io;
  payload_s payload;
  transfer_completion_cb callback;
  const std::string filename;
  // Offset of first payload byte not yet put in a block
  std::size_t offset;
  bool is_last_block;
  state current_state;
  // Encoded data packet of current block, kept for retransmission
  packet::bytes outgoing;
  // One byte more than largest valid datagram so that oversized datagrams are detected
  std::array<uint8_t, packet::max_datagram_len + 1> incoming;
  nio::peer_channel channel;
};

} // namespace rotftp

#endif
