#ifndef __ROTFTP_COMMON_HPP__
#define __ROTFTP_COMMON_HPP__
#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include "rotftp/error_code.hpp"
#include "rotftp/log.hpp"
#include "rotftp/network_io.hpp"
#include "rotftp/project_config.hpp"
#include "rotftp/utility.hpp"

namespace rotftp {
using boost::asio::ip::udp;
using nio::ms_duration;

// Parameters every worker talking to a single peer needs
class base_config {
public:
  base_config(const udp::endpoint &remote_endpoint, const ms_duration network_timeout, const uint16_t max_retry_count)
      : remote_endpoint(remote_endpoint),
        network_timeout(network_timeout),
        max_retry_count(max_retry_count) {}

  const udp::endpoint remote_endpoint;
  const ms_duration network_timeout;
  // Transmissions of one block, first one included
  const uint16_t max_retry_count;
};

/* base_worker tracks life of a conversation with one peer
 *
 *   worker_constructed --start()--> worker_running --exit()--> worker_completed
 *                                        |                          ^
 *                                        +--abort()--> worker_aborted
 *
 * and keeps the per block retry budget. Children implement start() and exit(). exit() must be reached
 * exactly once, whatever way the conversation ends.
 */
class base_worker {
public:
  enum run_stage { worker_constructed, worker_running, worker_completed, worker_aborted };

  virtual ~base_worker() {}

  virtual void start() = 0;

  // Marks worker aborted. Child is expected to cancel pending operations and land in exit()
  virtual void abort() {
    if (this->worker_stage != worker_running) {
      DEBUG("%s Abort ignored, worker is not running", to_string(this->remote_endpoint).c_str());
      return;
    }
    this->worker_stage = worker_aborted;
  }

  run_stage get_stage() const { return this->worker_stage; }

protected:
  base_worker(const base_config &config)
      : remote_endpoint(config.remote_endpoint),
        network_timeout(config.network_timeout),
        max_retry_count(config.max_retry_count),
        block_number(0),
        retry_budget(config.max_retry_count),
        worker_stage(worker_constructed) {}

  virtual void exit(error_code e) = 0;

  void set_stage_running() { this->worker_stage = worker_running; }

  void set_stage_completed() { this->worker_stage = worker_completed; }

  // Called once a block is acknowledged, next block gets the full budget
  void refill_retry_budget() { this->retry_budget = this->max_retry_count; }

  // Spends one transmission of current block. Returns false once nothing is left
  bool spend_retry() {
    if (this->retry_budget > 0) {
      this->retry_budget--;
    }
    return this->retry_budget > 0;
  }

  const udp::endpoint remote_endpoint;
  const ms_duration network_timeout;
  const uint16_t max_retry_count;

  // Number of the block last put on the wire, 0 before first one
  uint16_t block_number;

private:
  uint16_t retry_budget;
  run_stage worker_stage;
};

} // namespace rotftp

#endif
