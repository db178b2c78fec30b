#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

#include "rotftp/config.hpp"
#include "rotftp/exception.hpp"
#include "rotftp/file_io.hpp"
#include "rotftp/log.hpp"
#include "rotftp/server.hpp"

static void usage(const char *name) {
  std::cout << "Usage :" << name
            << " [-C <config file>] [-H <host address>] [-P <port number>] [-F <payload file>]"
               " [-R <retries>] [-T <timeout ms>] [-M <max transfers>] [-v]"
            << std::endl;
}

int main(int argc, char **argv) {
  int opt;
  std::string conf_file, ip, port, payload_file, retries, timeout, max_transfers;
  bool verbose = false;
  while ((opt = getopt(argc, argv, "C:H:P:F:R:T:M:vh")) != -1) {
    switch (opt) {
    case 'C':
      conf_file = std::string(optarg);
      break;
    case 'H':
      ip = std::string(optarg);
      break;
    case 'P':
      port = std::string(optarg);
      break;
    case 'F':
      payload_file = std::string(optarg);
      break;
    case 'R':
      retries = std::string(optarg);
      break;
    case 'T':
      timeout = std::string(optarg);
      break;
    case 'M':
      max_transfers = std::string(optarg);
      break;
    case 'v':
      verbose = true;
      break;
    case 'h':
      usage(argv[0]);
      return 0;
    case '?':
    default:
      usage(argv[0]);
      return -1;
    }
  }

  openlog("rotftpd", LOG_CONS | LOG_PID | LOG_PERROR, LOG_DAEMON);
  setlogmask(LOG_UPTO(verbose ? LOG_DEBUG : LOG_INFO));

  rotftp::server_conf settings;
  try {
    if (!conf_file.empty()) {
      settings = rotftp::conf(conf_file).server;
    }
    // Command line wins over configuration file
    if (!ip.empty()) {
      settings.address = ip;
    }
    if (!port.empty()) {
      settings.port = port;
    }
    if (!payload_file.empty()) {
      settings.payload_file = payload_file;
    }
    if (!retries.empty()) {
      settings.retries = static_cast<uint16_t>(rotftp::parse_number(retries, "retries", 0, rotftp::max_retries_setting));
    }
    if (!timeout.empty()) {
      settings.timeout_ms = rotftp::parse_number(timeout, "timeout", 0, rotftp::max_timeout_ms_setting);
    }
    if (!max_transfers.empty()) {
      settings.max_transfers = static_cast<std::size_t>(
          rotftp::parse_number(max_transfers, "max transfers", 0, rotftp::max_transfers_setting));
    }
  } catch (rotftp::exception &e) {
    ERROR("%s", e.what());
    usage(argv[0]);
    return -1;
  }
  if (settings.payload_file.empty()) {
    std::cout << "No payload file. check " << argv[0] << " -h" << std::endl;
    return -1;
  }

  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  rotftp::distributor_s tftp_server;
  int exit_status = 0;
  try {
    rotftp::server_config config(rotftp::fileio::load_payload(settings.payload_file),
                                 settings.retries,
                                 rotftp::ms_duration(settings.timeout_ms),
                                 settings.max_transfers);
    // Daemon has nothing to do without its listening socket
    config.on_service_error = [&](rotftp::error_code e) {
      ERROR("Shutting down, listening socket failed with %u", e);
      exit_status = -1;
      boost::system::error_code ignored;
      signals.cancel(ignored);
      tftp_server->stop_service();
    };
    udp::resolver resolver(io);
    udp::endpoint local_endpoint = *resolver.resolve(udp::v4(), settings.address, settings.port).begin();
    tftp_server                  = rotftp::distributor::create(io, local_endpoint, config);
  } catch (rotftp::exception &e) {
    ERROR("%s", e.what());
    return -1;
  } catch (boost::system::system_error &e) {
    ERROR("Failed to listen on %s:%s :%s", settings.address.c_str(), settings.port.c_str(), e.what());
    return -1;
  }

  signals.async_wait([&](const boost::system::error_code &error, int signal_number) {
    if (error) {
      return;
    }
    NOTICE("Received signal %d", signal_number);
    tftp_server->stop_service();
  });

  tftp_server->start_service();
  io.run();
  NOTICE("Served %lu, failed %lu", tftp_server->served_count(), tftp_server->failed_count());
  closelog();
  return exit_status;
}
