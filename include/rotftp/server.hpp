#ifndef __ROTFTP_SERVER_HPP__
#define __ROTFTP_SERVER_HPP__

#include <array>
#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include "rotftp/common.hpp"
#include "rotftp/packet.hpp"
#include "rotftp/project_config.hpp"
#include "rotftp/transfer.hpp"

using boost::asio::ip::udp;

namespace rotftp {

class distributor;
typedef std::shared_ptr<distributor> distributor_s;

/* Invoked once when listening socket fails and distributor stops taking requests. e is
 * error::boost_asio_error_base plus the asio error value. Running transfers are not touched.
 */
typedef std::function<void(error_code e)> service_error_cb;

// Largest payload whose blocks can be numbered without wrapping the 16 bit block number
constexpr std::size_t max_payload_size = 65535 * packet::max_data_len - 1;

class server_config {
public:
  server_config(payload_s payload                     = nullptr,
                const uint16_t max_retry_count        = 0,
                const ms_duration network_timeout     = ms_duration(0),
                const std::size_t max_transfers       = 0,
                transfer_completion_cb on_transfer_complete = nullptr,
                service_error_cb on_service_error           = nullptr)
      : payload(payload),
        max_retry_count(max_retry_count),
        network_timeout(network_timeout),
        max_transfers(max_transfers),
        on_transfer_complete(on_transfer_complete),
        on_service_error(on_service_error) {}

  /* Fills unset values (zero retry count, zero timeout) with defaults. Throws invalid_config_exception if
   * no payload is set, payload is too large for 16 bit block numbers or timeout is negative.
   */
  void validate();

  payload_s payload;
  uint16_t max_retry_count;
  ms_duration network_timeout;
  // Limit on concurrently running transfers, 0 is unlimited
  std::size_t max_transfers;
  // Called after a transfer finished and was forgotten by the distributor
  transfer_completion_cb on_transfer_complete;
  service_error_cb on_service_error;
};

/* `distributor` provides tftp server functionality. distributor usage
 * 1. Create distributor_s object
 *      distributor_s server = distributor::create(...)
 *    create validates configuration and binds listening socket, it throws if either fails.
 * 2. Start listening for read requests:
 *      server->start_service()
 *    start_service asynchronously start server. server will continue to run untill stopped.
 * 3. Stop server
 *      server->stop_service()
 *    Listening socket is closed and every running transfer is aborted.
 * If listening socket fails on its own, it's closed and on_service_error of server_config is called. No
 * more requests are accepted, running transfers continue till they end.
 * distributor object acts as a listener and starts a separate transfer object per client to perform the
 * real operation. A client with a running transfer can't start a second one, its repeated read requests
 * are ignored. distributor methods must be called from the thread running io context.
 */
class distributor : public std::enable_shared_from_this<distributor> {
public:
  /* Creates distributor_s object
   * Argument
   * io               :asio io context object
   * local_endpoint   :udp::endpoint on which server will listen for new connection
   * config           :payload and transfer parameters
   * Return : distributor_s object
   */
  static distributor_s create(boost::asio::io_context &io, const udp::endpoint &local_endpoint, server_config config);

  uint64_t start_service();

  uint64_t stop_service();

  const udp::endpoint &local_endpoint() const { return this->listen_endpoint; }

  std::size_t active_transfers() const { return this->live_transfers.size(); }

  uint64_t served_count() const { return this->served; }

  uint64_t failed_count() const { return this->failed; }

  // error::no_error while listening socket is healthy
  error_code service_error() const { return this->listen_error; }

private:
  distributor(boost::asio::io_context &io, const udp::endpoint &local_endpoint, const server_config &config);

  void perform_distribution();

  void perform_distribution_cb(const boost::system::error_code &error, const std::size_t &bytes_received);

  void spin_transfer(const packet::rrq_packet &request);

  void reject(const packet::error_code &ec, const std::string &message);

  void transfer_completed(const udp::endpoint &remote_endpoint, error_code e, uint16_t blocks_sent);

  boost::asio::io_context &io;
  udp::socket socket;
  udp::endpoint listen_endpoint;
  const server_config config;

  // These two data members are forcing distributor to accept one request at a time
  std::array<uint8_t, packet::max_datagram_len + 1> first_frame;
  udp::endpoint remote_endpoint;

  std::map<udp::endpoint, transfer_s> live_transfers;
  uint64_t server_count;
  uint64_t served;
  uint64_t failed;
  error_code listen_error;
};

} // namespace rotftp

#endif
