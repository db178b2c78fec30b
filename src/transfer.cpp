#include <algorithm>
#include <optional>
#include <variant>

#include "rotftp/log.hpp"
#include "rotftp/transfer.hpp"
#include "rotftp/utility.hpp"

using boost::asio::ip::udp;
using namespace rotftp;

transfer::transfer(boost::asio::io_context &io, const transfer_config &config)
    : base_worker(config),
      io(io),
      payload(config.payload),
      callback(config.callback),
      filename(config.filename),
      offset(0),
      is_last_block(false),
      current_state(sending_block),
      channel(io, config.remote_endpoint) {
  XDEBUG("%s Provisioned transfer on %s",
         to_string(this->remote_endpoint).c_str(),
         to_string(this->channel.local_endpoint()).c_str());
}

transfer::~transfer() { XDEBUG("%s Destroyed transfer object", to_string(this->remote_endpoint).c_str()); }

transfer_s transfer::create(boost::asio::io_context &io, const transfer_config &config) {
  transfer_s self(new transfer(io, config));
  return self;
}

void transfer::start() {
  if (this->get_stage() != worker_constructed) {
    return;
  }
  this->set_stage_running();
  INFO("%s Requested file %s, serving %lu bytes from %s",
       to_string(this->remote_endpoint).c_str(),
       this->filename.c_str(),
       this->payload->size(),
       to_string(this->channel.local_endpoint()).c_str());
  this->send_data();
}

void transfer::abort() {
  boost::asio::dispatch(this->io, [self = shared_from_this()]() {
    if (self->get_stage() != worker_running) {
      return;
    }
    self->base_worker::abort();
    self->channel.cancel();
  });
}

void transfer::send_data(const bool &resend) {
  // On resend block number and data stay as they are, the exact bytes sent last time go out again
  if (!resend) {
    const std::size_t chunk = std::min(this->payload->size() - this->offset, packet::max_data_len);
    this->block_number++;
    packet::data_packet data(this->block_number, packet::const_view(this->payload->data() + this->offset, chunk));
    this->offset += chunk;
    this->is_last_block = data.is_last();
    this->outgoing      = data.buffer();
    this->current_state = sending_block;
    XDEBUG("%s Sending block %u with %lu bytes", to_string(this->remote_endpoint).c_str(), this->block_number, chunk);
  } else {
    INFO("%s Resending block number %u", to_string(this->remote_endpoint).c_str(), this->block_number);
  }
  this->channel.async_send(boost::asio::buffer(this->outgoing),
                           std::bind(&transfer::send_data_cb,
                                     shared_from_this(),
                                     std::placeholders::_1,
                                     std::placeholders::_2));
}

void transfer::send_data_cb(const boost::system::error_code &error, const std::size_t &) {
  if (this->get_stage() == worker_aborted) {
    this->exit(error::user_requested_abort);
    return;
  }
  if (error) {
    ERROR("%s Failed to send block %u :%s",
          to_string(this->remote_endpoint).c_str(),
          this->block_number,
          to_string(error).c_str());
    this->exit(error::boost_asio_error_base + error.value());
    return;
  }
  this->current_state = awaiting_ack;
  this->channel.set_deadline(this->network_timeout);
  this->receive_ack();
}

void transfer::receive_ack() {
  this->channel.async_receive(boost::asio::buffer(this->incoming),
                              std::bind(&transfer::receive_ack_cb,
                                        shared_from_this(),
                                        std::placeholders::_1,
                                        std::placeholders::_2));
}

void transfer::receive_ack_cb(const boost::system::error_code &error, const std::size_t &bytes_received) {
  if (this->get_stage() == worker_aborted) {
    this->exit(error::user_requested_abort);
    return;
  }
  if (error == boost::asio::error::timed_out) {
    WARN("%s Timed out while waiting for ack of block %u",
         to_string(this->remote_endpoint).c_str(),
         this->block_number);
    if (!this->spend_retry()) {
      this->exit(error::receive_timeout);
      return;
    }
    this->send_data(true);
    return;
  }
  if (error) {
    ERROR("%s Failed to receive ack :%s", to_string(this->remote_endpoint).c_str(), to_string(error).c_str());
    this->exit(error::boost_asio_error_base + error.value());
    return;
  }
  if (this->channel.sender() != this->remote_endpoint) {
    WARN("%s Received data from unknown endpoint %s. Message is Rejected",
         to_string(this->remote_endpoint).c_str(),
         to_string(this->channel.sender()).c_str());
    this->reject_sender();
    this->receive_ack();
    return;
  }

  std::optional<packet::any_packet> reply;
  try {
    reply = packet::parse(packet::const_view(this->incoming.data(), bytes_received));
  } catch (framing_exception &e) {
    WARN("%s Bad packet :%s", to_string(this->remote_endpoint).c_str(), e.what());
    this->receive_ack();
    return;
  }

  if (auto ack = std::get_if<packet::ack_packet>(&*reply)) {
    if (ack->block_number != this->block_number) {
      XDEBUG("%s Ignoring ack for block %u, waiting for %u",
             to_string(this->remote_endpoint).c_str(),
             ack->block_number,
             this->block_number);
      this->receive_ack();
      return;
    }
    this->refill_retry_budget();
    if (this->is_last_block) {
      this->exit(error::no_error);
      return;
    }
    this->send_data();
    return;
  }
  if (auto err = std::get_if<packet::err_packet>(&*reply)) {
    ERROR("%s Received error %u :%s",
          to_string(this->remote_endpoint).c_str(),
          static_cast<uint16_t>(err->ec),
          err->message.c_str());
    this->exit(error::peer_error_response);
    return;
  }
  WARN("%s Bad packet :op code %u is not expected during transfer",
       to_string(this->remote_endpoint).c_str(),
       static_cast<uint16_t>(packet::get_opcode(packet::const_view(this->incoming.data(), bytes_received))));
  this->receive_ack();
}

void transfer::reject_sender() {
  // Deadline and retry budget of the peer are left as they are
  auto frame = std::make_shared<packet::bytes>(
      packet::err_packet(packet::error_code::unknown_transfer_id, "Unknown transfer ID").buffer());
  const udp::endpoint stranger = this->channel.sender();
  this->channel.async_send_to(boost::asio::buffer(*frame),
                              stranger,
                              [frame, stranger](const boost::system::error_code &error, const std::size_t &) {
                                if (error && error != boost::asio::error::operation_aborted) {
                                  WARN("%s Failed to send error packet :%s",
                                       to_string(stranger).c_str(),
                                       to_string(error).c_str());
                                }
                              });
}

void transfer::exit(error_code e) {
  if (this->get_stage() == worker_completed) {
    return;
  }
  this->set_stage_completed();
  this->current_state = (e == error::no_error) ? done : failed;
  this->channel.close();
  if (e == error::no_error) {
    NOTICE("%s Sent %u blocks", to_string(this->remote_endpoint).c_str(), this->block_number);
  } else {
    ERROR("%s Transfer failed at block %u, %s(%u)",
          to_string(this->remote_endpoint).c_str(),
          this->block_number,
          describe(e),
          e);
  }
  if (this->callback) {
    this->callback(this->remote_endpoint, e, this->block_number);
  }
}
