#define BOOST_TEST_MODULE rotftp server

#include <boost/test/included/unit_test.hpp>
#include <arpa/inet.h>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <mutex>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <vector>

#include "rotftp/error_code.hpp"
#include "rotftp/exception.hpp"
#include "rotftp/packet.hpp"
#include "rotftp/server.hpp"
#include "test_utility.hpp"

namespace packet = rotftp::packet;
using boost::asio::ip::udp;
using namespace std::chrono_literals;

// File descriptor of the IPv4 datagram socket bound to port, -1 if there is none
static int find_udp_socket(unsigned short port) {
  for (auto &entry : std::filesystem::directory_iterator("/proc/self/fd")) {
    int fd = std::stoi(entry.path().filename().string());
    int type          = 0;
    socklen_t type_len = sizeof(type);
    if (getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &type_len) != 0 || type != SOCK_DGRAM) {
      continue;
    }
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &addr_len) != 0 || addr.sin_family != AF_INET) {
      continue;
    }
    if (ntohs(addr.sin_port) == port) {
      return fd;
    }
  }
  return -1;
}

struct completion {
  udp::endpoint remote_endpoint;
  rotftp::error_code e;
  uint16_t blocks_sent;
};

class server_fixture {
public:
  server_fixture()
      : work(boost::asio::make_work_guard(io)),
        runner([this]() { this->io.run(); }) {}

  ~server_fixture() {
    this->work.reset();
    this->io.stop();
    this->runner.join();
  }

  void launch(rotftp::server_config config) {
    config.on_transfer_complete = [this](const udp::endpoint &remote_endpoint, rotftp::error_code e, uint16_t blocks) {
      std::lock_guard<std::mutex> guard(this->lock);
      this->completions.push_back({remote_endpoint, e, blocks});
      this->completed.notify_all();
    };
    config.on_service_error = [this](rotftp::error_code e) {
      std::lock_guard<std::mutex> guard(this->lock);
      this->service_errors.push_back(e);
      this->completed.notify_all();
    };
    this->server = rotftp::distributor::create(this->io, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0), config);
    this->on_io([this]() { return this->server->start_service(); });
  }

  // Runs fn on io thread and returns its result. distributor isn't thread safe
  template <typename Fn>
  auto on_io(Fn fn) -> decltype(fn()) {
    std::promise<decltype(fn())> result;
    boost::asio::post(this->io, [&]() { result.set_value(fn()); });
    return result.get_future().get();
  }

  std::vector<completion> wait_completions(std::size_t count, std::chrono::milliseconds timeout = 5000ms) {
    std::unique_lock<std::mutex> guard(this->lock);
    bool reached =
        this->completed.wait_for(guard, timeout, [this, count]() { return this->completions.size() >= count; });
    BOOST_REQUIRE_MESSAGE(reached, "expected " << count << " finished transfers, got " << this->completions.size());
    return this->completions;
  }

  void request(loopback_peer &client, const std::string &filename = "hello.txt", const std::string &mode = "octet") {
    client.send(packet::rrq_packet(filename, mode).buffer(), this->server->local_endpoint());
  }

  // Downloads whole payload, tid is set to endpoint data came from
  packet::bytes download(loopback_peer &client, udp::endpoint &tid) {
    packet::bytes received;
    uint16_t block_number = 1;
    while (true) {
      auto datagram = client.receive(2000ms, &tid);
      BOOST_REQUIRE_MESSAGE(datagram.has_value(), "no data packet for block " << block_number);
      packet::data_packet data(*datagram);
      BOOST_REQUIRE_EQUAL(data.block_number, block_number);
      received.insert(received.end(), data.data.begin(), data.data.end());
      client.send(packet::ack_packet(block_number).buffer(), tid);
      if (data.is_last()) {
        return received;
      }
      block_number++;
    }
  }

  boost::asio::io_context io;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  std::thread runner;
  rotftp::distributor_s server;
  std::mutex lock;
  std::condition_variable completed;
  std::vector<completion> completions;
  std::vector<rotftp::error_code> service_errors;
};

BOOST_FIXTURE_TEST_SUITE(distribution, server_fixture)

BOOST_AUTO_TEST_CASE(hello_world) {
  this->launch(rotftp::server_config(make_payload("hello world"), 10, 1000ms));
  loopback_peer client;
  this->request(client);

  udp::endpoint tid;
  auto datagram = client.receive(2000ms, &tid);
  BOOST_REQUIRE(datagram.has_value());
  packet::data_packet data(*datagram);
  BOOST_TEST(data.block_number == 1);
  BOOST_TEST(std::string(data.data.begin(), data.data.end()) == "hello world");
  // Transfer runs on its own port, listening port only takes requests
  BOOST_TEST(tid.port() != this->server->local_endpoint().port());

  client.send(packet::ack_packet(1).buffer(), tid);
  auto finished = this->wait_completions(1);
  BOOST_TEST(finished[0].e == rotftp::error::no_error);
  BOOST_TEST(finished[0].blocks_sent == 1);
  BOOST_TEST((finished[0].remote_endpoint == client.endpoint()));
  BOOST_TEST(this->on_io([this]() { return this->server->served_count(); }) == 1u);
  BOOST_TEST(this->on_io([this]() { return this->server->active_transfers(); }) == 0u);
}

BOOST_AUTO_TEST_CASE(bad_requests_are_dropped) {
  this->launch(rotftp::server_config(make_payload("hello world"), 10, 1000ms));
  loopback_peer client;
  this->request(client, "hello.txt", "netascii");
  client.send({0x00, 0x02, 'x', 0x00, 'o', 'c', 't', 'e', 't', 0x00}, this->server->local_endpoint());
  client.send({0x00, 0x04, 0x00, 0x01}, this->server->local_endpoint());
  client.send({0x00, 0x01, 'x'}, this->server->local_endpoint());
  BOOST_TEST(!client.receive(200ms).has_value(), "bad request got a reply");
  BOOST_TEST(this->on_io([this]() { return this->server->active_transfers(); }) == 0u);

  // Server keeps listening
  this->request(client);
  udp::endpoint tid;
  BOOST_TEST(this->download(client, tid) == *make_payload("hello world"));
  BOOST_TEST(this->wait_completions(1)[0].e == rotftp::error::no_error);
}

BOOST_AUTO_TEST_CASE(concurrent_clients) {
  auto payload = make_payload(1300);
  this->launch(rotftp::server_config(payload, 5, 2000ms));
  std::vector<std::unique_ptr<loopback_peer>> clients;
  for (int i = 0; i < 3; i++) {
    clients.push_back(std::make_unique<loopback_peer>());
    this->request(*clients.back(), "file" + std::to_string(i));
  }

  std::vector<udp::endpoint> tids;
  for (auto &client : clients) {
    udp::endpoint tid;
    BOOST_TEST(this->download(*client, tid) == *payload);
    tids.push_back(tid);
  }
  BOOST_TEST((tids[0] != tids[1]));
  BOOST_TEST((tids[1] != tids[2]));
  BOOST_TEST((tids[0] != tids[2]));

  auto finished = this->wait_completions(3);
  for (auto &result : finished) {
    BOOST_TEST(result.e == rotftp::error::no_error);
    BOOST_TEST(result.blocks_sent == 3);
  }
  BOOST_TEST(this->on_io([this]() { return this->server->served_count(); }) == 3u);
}

BOOST_AUTO_TEST_CASE(repeated_request_is_ignored) {
  this->launch(rotftp::server_config(make_payload("hello world"), 5, 2000ms));
  loopback_peer client;
  this->request(client);
  udp::endpoint tid;
  auto first = client.receive(2000ms, &tid);
  BOOST_REQUIRE(first.has_value());

  this->request(client);
  BOOST_TEST(!client.receive(200ms).has_value(), "repeated request started a second transfer");
  BOOST_TEST(this->on_io([this]() { return this->server->active_transfers(); }) == 1u);

  client.send(packet::ack_packet(1).buffer(), tid);
  this->wait_completions(1);
  std::this_thread::sleep_for(100ms);
  std::lock_guard<std::mutex> guard(this->lock);
  BOOST_TEST(this->completions.size() == 1u);
}

BOOST_AUTO_TEST_CASE(busy_server_rejects_request) {
  this->launch(rotftp::server_config(make_payload("hello world"), 5, 2000ms, 1));
  loopback_peer first, second;
  this->request(first);
  udp::endpoint tid;
  BOOST_REQUIRE(first.receive(2000ms, &tid).has_value());

  this->request(second);
  udp::endpoint rejected_by;
  auto reply = second.receive(2000ms, &rejected_by);
  BOOST_REQUIRE(reply.has_value());
  packet::err_packet err(*reply);
  BOOST_TEST((err.ec == packet::error_code::unknown));
  BOOST_TEST(err.message == "Server busy");
  BOOST_TEST((rejected_by.port() == this->server->local_endpoint().port()));

  first.send(packet::ack_packet(1).buffer(), tid);
  this->wait_completions(1);

  // Slot is free again
  this->request(second);
  BOOST_TEST(this->download(second, tid) == *make_payload("hello world"));
  BOOST_TEST(this->wait_completions(2)[1].e == rotftp::error::no_error);
}

BOOST_AUTO_TEST_CASE(failed_transfer_is_counted) {
  this->launch(rotftp::server_config(make_payload("hello world"), 2, 50ms));
  loopback_peer client;
  this->request(client);
  BOOST_REQUIRE(client.receive(2000ms).has_value());
  auto finished = this->wait_completions(1);
  BOOST_TEST(finished[0].e == rotftp::error::receive_timeout);
  BOOST_TEST(this->on_io([this]() { return this->server->failed_count(); }) == 1u);
  BOOST_TEST(this->on_io([this]() { return this->server->served_count(); }) == 0u);
}

BOOST_AUTO_TEST_CASE(stop_aborts_running_transfers) {
  this->launch(rotftp::server_config(make_payload(5000), 5, 5000ms));
  loopback_peer client;
  this->request(client);
  BOOST_REQUIRE(client.receive(2000ms).has_value());

  BOOST_TEST(this->on_io([this]() { return this->server->stop_service(); }) == 1u);
  auto finished = this->wait_completions(1);
  BOOST_TEST(finished[0].e == rotftp::error::user_requested_abort);

  // Listening socket is closed
  loopback_peer late;
  this->request(late);
  BOOST_TEST(!late.receive(200ms).has_value());
}

/* Listening socket is made to fail: with IP_RECVERR an ICMP port unreachable for the busy reply to a
 * closed client port surfaces as connection refused on the pending receive.
 */
BOOST_AUTO_TEST_CASE(listening_failure_is_reported) {
  this->launch(rotftp::server_config(make_payload("hello world"), 5, 3000ms, 1));
  loopback_peer first;
  this->request(first);
  udp::endpoint tid;
  BOOST_REQUIRE(first.receive(2000ms, &tid).has_value());

  int listen_fd = find_udp_socket(this->server->local_endpoint().port());
  BOOST_REQUIRE(listen_fd >= 0);
  int enable = 1;
  BOOST_REQUIRE(setsockopt(listen_fd, IPPROTO_IP, IP_RECVERR, &enable, sizeof(enable)) == 0);

  // Hold io thread so that client is gone before its request is served
  std::promise<void> paused, resume;
  auto resumed = resume.get_future();
  boost::asio::post(this->io, [&]() {
    paused.set_value();
    resumed.wait();
  });
  paused.get_future().wait();
  {
    loopback_peer vanished;
    this->request(vanished);
  }
  resume.set_value();

  {
    std::unique_lock<std::mutex> guard(this->lock);
    bool reported = this->completed.wait_for(guard, 5000ms, [this]() { return !this->service_errors.empty(); });
    BOOST_REQUIRE_MESSAGE(reported, "listening failure was not reported");
    BOOST_TEST(this->service_errors.size() == 1u);
    BOOST_TEST(this->service_errors[0] >= rotftp::error::boost_asio_error_base);
  }
  BOOST_TEST(this->on_io([this]() { return this->server->service_error(); }) >= rotftp::error::boost_asio_error_base);

  // No more requests are taken, running transfer is unaffected
  loopback_peer late;
  this->request(late);
  BOOST_TEST(!late.receive(200ms).has_value());
  first.send(packet::ack_packet(1).buffer(), tid);
  auto finished = this->wait_completions(1);
  BOOST_TEST(finished[0].e == rotftp::error::no_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_CASE(stop_lets_io_context_return) {
  boost::asio::io_context io;
  auto server = rotftp::distributor::create(io,
                                            udp::endpoint(boost::asio::ip::address_v4::loopback(), 0),
                                            rotftp::server_config(make_payload(2000), 5, 5000ms));
  server->start_service();
  auto runner = std::async(std::launch::async, [&io]() { io.run(); });

  loopback_peer client;
  client.send(packet::rrq_packet("a").buffer(), server->local_endpoint());
  BOOST_REQUIRE(client.receive(2000ms).has_value());
  boost::asio::post(io, [server]() { server->stop_service(); });

  bool returned = runner.wait_for(5000ms) == std::future_status::ready;
  if (!returned) {
    io.stop();
  }
  BOOST_TEST(returned, "io context kept running after stop_service");
  runner.get();
  BOOST_TEST(server->failed_count() == 1u);
  BOOST_TEST(server->active_transfers() == 0u);
}

BOOST_AUTO_TEST_CASE(config_requires_payload) {
  rotftp::server_config missing;
  BOOST_CHECK_THROW(missing.validate(), rotftp::invalid_config_exception);
  rotftp::server_config empty(make_payload(0));
  BOOST_CHECK_THROW(empty.validate(), rotftp::invalid_config_exception);
}

BOOST_AUTO_TEST_CASE(config_rejects_payload_beyond_block_numbers) {
  rotftp::server_config largest(make_payload(rotftp::max_payload_size));
  BOOST_CHECK_NO_THROW(largest.validate());
  rotftp::server_config too_large(make_payload(rotftp::max_payload_size + 1));
  BOOST_CHECK_THROW(too_large.validate(), rotftp::invalid_config_exception);
}

BOOST_AUTO_TEST_CASE(config_rejects_negative_timeout) {
  rotftp::server_config config(make_payload(10), 3, rotftp::ms_duration(-1));
  BOOST_CHECK_THROW(config.validate(), rotftp::invalid_config_exception);
}

BOOST_AUTO_TEST_CASE(config_fills_defaults) {
  rotftp::server_config unset(make_payload(10));
  unset.validate();
  BOOST_TEST(unset.max_retry_count == ROTFTP_CONF_MAX_RETRY_COUNT);
  BOOST_TEST(unset.network_timeout.count() == ROTFTP_CONF_NETWORK_TIMEOUT);

  rotftp::server_config set(make_payload(10), 3, rotftp::ms_duration(250));
  set.validate();
  BOOST_TEST(set.max_retry_count == 3);
  BOOST_TEST(set.network_timeout.count() == 250);
}

BOOST_AUTO_TEST_CASE(create_validates_config) {
  boost::asio::io_context io;
  BOOST_CHECK_THROW(rotftp::distributor::create(io, udp::endpoint(udp::v4(), 0), rotftp::server_config()),
                    rotftp::invalid_config_exception);
}

BOOST_AUTO_TEST_CASE(create_fails_on_busy_port) {
  boost::asio::io_context io;
  auto first = rotftp::distributor::create(io,
                                           udp::endpoint(boost::asio::ip::address_v4::loopback(), 0),
                                           rotftp::server_config(make_payload(10)));
  BOOST_CHECK_THROW(rotftp::distributor::create(io, first->local_endpoint(), rotftp::server_config(make_payload(10))),
                    boost::system::system_error);
}
