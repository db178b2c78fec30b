#include <optional>
#include <vector>

#include "rotftp/exception.hpp"
#include "rotftp/log.hpp"
#include "rotftp/server.hpp"
#include "rotftp/utility.hpp"

using boost::asio::ip::udp;
using namespace rotftp;

void server_config::validate() {
  if (this->payload == nullptr || this->payload->empty()) {
    throw invalid_config_exception("Payload is required");
  }
  if (this->payload->size() > max_payload_size) {
    throw invalid_config_exception("Payload of " + std::to_string(this->payload->size()) +
                                   " bytes needs more than 65535 blocks");
  }
  if (this->network_timeout < ms_duration(0)) {
    throw invalid_config_exception("Network timeout can't be negative");
  }
  if (this->max_retry_count == 0) {
    this->max_retry_count = ROTFTP_CONF_MAX_RETRY_COUNT;
  }
  if (this->network_timeout == ms_duration(0)) {
    this->network_timeout = ms_duration(ROTFTP_CONF_NETWORK_TIMEOUT);
  }
}

distributor::distributor(boost::asio::io_context &io,
                         const udp::endpoint &local_endpoint,
                         const server_config &config)
    : io(io),
      socket(io, local_endpoint),
      listen_endpoint(socket.local_endpoint()),
      config(config),
      server_count(0),
      served(0),
      failed(0),
      listen_error(error::no_error) {}

distributor_s distributor::create(boost::asio::io_context &io, const udp::endpoint &local_endpoint, server_config config) {
  config.validate();
  return distributor_s(new distributor(io, local_endpoint, config));
}

uint64_t distributor::start_service() {
  NOTICE("Starting distribution on %s, %lu bytes payload, %u retries, %ld ms timeout",
         to_string(this->listen_endpoint).c_str(),
         this->config.payload->size(),
         this->config.max_retry_count,
         static_cast<long>(this->config.network_timeout.count()));
  this->perform_distribution();
  return this->server_count;
}

uint64_t distributor::stop_service() {
  NOTICE("Stopping distribution on %s", to_string(this->listen_endpoint).c_str());
  boost::system::error_code error;
  this->socket.close(error);
  if (error) {
    WARN("Failed to close %s :%s", to_string(this->listen_endpoint).c_str(), to_string(error).c_str());
  }
  std::vector<transfer_s> running;
  for (auto &[endpoint, worker] : this->live_transfers) {
    running.push_back(worker);
  }
  for (auto &worker : running) {
    worker->abort();
  }
  return this->server_count;
}

void distributor::perform_distribution() {
  this->socket.async_receive_from(boost::asio::buffer(this->first_frame),
                                  this->remote_endpoint,
                                  std::bind(&distributor::perform_distribution_cb,
                                            shared_from_this(),
                                            std::placeholders::_1,
                                            std::placeholders::_2));
}

void distributor::perform_distribution_cb(const boost::system::error_code &error, const std::size_t &bytes_received) {
  if (error == boost::asio::error::operation_aborted) {
    return;
  }
  if (error) {
    ERROR("Listening socket %s failed :%s. No more requests are accepted",
          to_string(this->listen_endpoint).c_str(),
          to_string(error).c_str());
    this->listen_error = error::boost_asio_error_base + error.value();
    boost::system::error_code close_error;
    this->socket.close(close_error);
    if (this->config.on_service_error) {
      this->config.on_service_error(this->listen_error);
    }
    return;
  }
  std::optional<packet::rrq_packet> request;
  try {
    request.emplace(packet::const_view(this->first_frame.data(), bytes_received));
  } catch (framing_exception &e) {
    WARN("%s Bad request :%s", to_string(this->remote_endpoint).c_str(), e.what());
    this->perform_distribution();
    return;
  }
  INFO("%s Received read request for %s", to_string(this->remote_endpoint).c_str(), request->filename.c_str());
  this->spin_transfer(*request);
  this->perform_distribution();
}

void distributor::spin_transfer(const packet::rrq_packet &request) {
  auto live = this->live_transfers.find(this->remote_endpoint);
  if (live != this->live_transfers.end()) {
    INFO("%s Transfer already running on %s. Request is ignored",
         to_string(this->remote_endpoint).c_str(),
         to_string(live->second->local_endpoint()).c_str());
    return;
  }
  if (this->config.max_transfers != 0 && this->live_transfers.size() >= this->config.max_transfers) {
    WARN("%s Rejected, %lu transfers are running", to_string(this->remote_endpoint).c_str(), this->live_transfers.size());
    this->reject(packet::error_code::unknown, "Server busy");
    return;
  }
  transfer_config t_config(this->remote_endpoint,
                           this->config.payload,
                           std::bind(&distributor::transfer_completed,
                                     shared_from_this(),
                                     std::placeholders::_1,
                                     std::placeholders::_2,
                                     std::placeholders::_3),
                           this->config.network_timeout,
                           this->config.max_retry_count,
                           request.filename);
  transfer_s worker;
  try {
    worker = transfer::create(this->io, t_config);
  } catch (boost::system::system_error &e) {
    ERROR("%s Failed to open transfer channel :%s", to_string(this->remote_endpoint).c_str(), e.what());
    this->reject(packet::error_code::unknown, "Failed to open transfer channel");
    return;
  }
  this->live_transfers[this->remote_endpoint] = worker;
  this->server_count++;
  worker->start();
}

void distributor::reject(const packet::error_code &ec, const std::string &message) {
  auto frame = std::make_shared<packet::bytes>(packet::err_packet(ec, message).buffer());
  const udp::endpoint endpoint = this->remote_endpoint;
  this->socket.async_send_to(boost::asio::buffer(*frame),
                             endpoint,
                             [frame, endpoint](const boost::system::error_code &error, const std::size_t &) {
                               if (error) {
                                 WARN("%s Failed to send error packet :%s",
                                      to_string(endpoint).c_str(),
                                      to_string(error).c_str());
                               }
                             });
}

void distributor::transfer_completed(const udp::endpoint &remote_endpoint, error_code e, uint16_t blocks_sent) {
  this->live_transfers.erase(remote_endpoint);
  if (e == error::no_error) {
    this->served++;
  } else {
    this->failed++;
  }
  if (this->config.on_transfer_complete) {
    this->config.on_transfer_complete(remote_endpoint, e, blocks_sent);
  }
}
