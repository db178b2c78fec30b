#ifndef __ROTFTP_NETWORK_IO_HPP__
#define __ROTFTP_NETWORK_IO_HPP__

#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <functional>

#include "rotftp/log.hpp"
#include "rotftp/utility.hpp"

namespace rotftp {
namespace nio {

using boost::asio::ip::udp;

typedef std::chrono::milliseconds ms_duration;

typedef std::function<void(const boost::system::error_code &, const std::size_t &)> completion_cb;

/* peer_channel is a datagram channel dedicated to one remote endpoint. It owns a socket bound to a fresh
 * ephemeral port, that port is the transfer id of the conversation with the peer.
 *
 * Receive is bounded by a deadline set with set_deadline(). The deadline is absolute, receiving again after
 * a stray datagram doesn't extend it. Once the deadline passes the pending receive completes with
 * boost::asio::error::timed_out. operation_aborted is only reported if cancel() or close() was called.
 *
 * Life of this object must be preserved by caller. Completion callbacks are expected to keep the owner alive
 * (bind shared_from_this()), the deadline timer holds a copy of the callback for the same reason.
 */
class peer_channel final {
public:
  peer_channel(boost::asio::io_context &io, const udp::endpoint &peer)
      : socket(io, udp::endpoint(peer.protocol(), 0)),
        timer(io),
        peer_endpoint(peer),
        deadline(std::chrono::steady_clock::now()),
        receive_id(0),
        deadline_expired(false) {}

  void set_deadline(const ms_duration &timeout) { this->deadline = std::chrono::steady_clock::now() + timeout; }

  void async_send(const boost::asio::const_buffer &asio_buffer, completion_cb callback) {
    XDEBUG("%s Sending %lu bytes", to_string(this->peer_endpoint).c_str(), asio_buffer.size());
    this->socket.async_send_to(asio_buffer, this->peer_endpoint, callback);
  }

  // Sends to an endpoint other than the peer, for instance an error reply to a stranger
  void async_send_to(const boost::asio::const_buffer &asio_buffer, const udp::endpoint &endpoint, completion_cb callback) {
    this->socket.async_send_to(asio_buffer, endpoint, callback);
  }

  void async_receive(const boost::asio::mutable_buffer &asio_buffer, completion_cb callback) {
    const uint64_t id      = ++this->receive_id;
    this->deadline_expired = false;
    if (std::chrono::steady_clock::now() >= this->deadline) {
      boost::asio::post(this->socket.get_executor(),
                        [callback]() { callback(boost::asio::error::timed_out, 0); });
      return;
    }
    this->socket.async_receive_from(
        asio_buffer,
        this->sender_endpoint,
        std::bind(&peer_channel::callback_transit, this, callback, std::placeholders::_1, std::placeholders::_2));
    this->timer.expires_at(this->deadline);
    this->timer.async_wait([this, callback, id](const boost::system::error_code &error) {
      (void)(callback);
      if (error == boost::asio::error::operation_aborted) {
        return;
      }
      // Expiry of an earlier receive that completed meanwhile
      if (id != this->receive_id) {
        return;
      }
      boost::system::error_code ignored;
      this->deadline_expired = true;
      this->socket.cancel(ignored);
    });
  }

  // Endpoint of the last received datagram
  const udp::endpoint &sender() const { return this->sender_endpoint; }

  const udp::endpoint &peer() const { return this->peer_endpoint; }

  udp::endpoint local_endpoint() const { return this->socket.local_endpoint(); }

  void cancel() {
    boost::system::error_code ignored;
    this->timer.cancel();
    this->socket.cancel(ignored);
  }

  void close() {
    boost::system::error_code error;
    this->timer.cancel();
    this->socket.close(error);
    if (error) {
      WARN("%s Failed to close channel :%s", to_string(this->peer_endpoint).c_str(), to_string(error).c_str());
    }
  }

private:
  void callback_transit(completion_cb callback,
                        const boost::system::error_code &error,
                        const std::size_t &bytes_received) {
    ++this->receive_id;
    this->timer.cancel();
    if (error == boost::asio::error::operation_aborted && this->deadline_expired) {
      this->deadline_expired = false;
      callback(boost::asio::error::timed_out, 0);
      return;
    }
    callback(error, bytes_received);
  }

  udp::socket socket;
  boost::asio::steady_timer timer;
  const udp::endpoint peer_endpoint;
  udp::endpoint sender_endpoint;
  std::chrono::steady_clock::time_point deadline;
  uint64_t receive_id;
  bool deadline_expired;
};

} // namespace nio
} // namespace rotftp
#endif
